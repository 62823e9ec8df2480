#pragma once

#include <string>
#include <vector>

#include <QDialog>

#include "cdkeygen/key_generator.hpp"

class QCheckBox;
class QLineEdit;
class QPlainTextEdit;

namespace cdkeygen {

class KeyForm : public QDialog {
    Q_OBJECT

public:
    // `log` receives a line per generate/save when the form was started
    // from a console; pass an empty sink otherwise.
    explicit KeyForm(LogSink log, QWidget* parent = nullptr);

private slots:
    void generateKeys();
    void saveKeys();
    void copyKeys();

private:
    QLineEdit* addRow(int row, const QString& label, const QString& value);

    LogSink m_log;
    std::vector<std::string> m_keys;

    QLineEdit* m_count = nullptr;
    QLineEdit* m_length = nullptr;
    QLineEdit* m_pattern = nullptr;
    QLineEdit* m_groupSize = nullptr;
    QLineEdit* m_separator = nullptr;
    QLineEdit* m_alphabet = nullptr;
    QCheckBox* m_allowAmbiguous = nullptr;
    QCheckBox* m_unique = nullptr;
    QPlainTextEdit* m_output = nullptr;
};

int RunKeyForm(int& argc, char* argv[], const LogSink& log);

}  // namespace cdkeygen
