#include "cdkeygen/key_form.hpp"

#include <QApplication>
#include <QCheckBox>
#include <QClipboard>
#include <QFileInfo>
#include <QFileDialog>
#include <QGridLayout>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QStringList>

#include <string_view>
#include <utility>

#include "cdkeygen/form_input.hpp"
#include "cdkeygen/key_writer.hpp"

namespace cdkeygen {

namespace {

QString JoinKeys(const std::vector<std::string>& keys) {
    QStringList lines;
    lines.reserve(static_cast<qsizetype>(keys.size()));
    for (const auto& key : keys) {
        lines.append(QString::fromStdString(key));
    }
    return lines.join('\n');
}

QString StatusText(const GenStatus status) {
    const std::string_view text = ToString(status);
    return QString::fromLatin1(text.data(), static_cast<qsizetype>(text.size()));
}

}  // namespace

KeyForm::KeyForm(LogSink log, QWidget* parent)
    : QDialog(parent), m_log(std::move(log)) {
    setWindowTitle(tr("CD Key Generator"));
    setMinimumSize(700, 450);

    const FormInput defaults;
    auto* grid = new QGridLayout(this);
    m_count = addRow(0, tr("How many keys?"), QString::fromStdString(defaults.count));
    m_length = addRow(1, tr("Key length (ignored if pattern used):"), QString::fromStdString(defaults.length));
    m_pattern = addRow(2, tr("Pattern (use X = random), optional:"), QString());
    m_pattern->setPlaceholderText(QStringLiteral("XXXXX-XXXXX-XXXXX-XXXXX-XXXXX"));
    m_groupSize = addRow(3, tr("Group size (0 = none):"), QString::fromStdString(defaults.group_size));
    m_separator = addRow(4, tr("Group separator:"), QString::fromStdString(defaults.separator));
    m_alphabet = addRow(5, tr("Alphabet (leave blank for default):"), QString());

    m_allowAmbiguous = new QCheckBox(tr("Allow ambiguous chars (0,O,1,I,L)"), this);
    m_allowAmbiguous->setChecked(defaults.allow_ambiguous);
    grid->addWidget(m_allowAmbiguous, 6, 1);
    m_unique = new QCheckBox(tr("Unique keys (no duplicates)"), this);
    m_unique->setChecked(defaults.unique);
    grid->addWidget(m_unique, 7, 1);

    grid->addWidget(new QLabel(tr("Generated Keys:"), this), 8, 0, Qt::AlignTop);
    m_output = new QPlainTextEdit(this);
    m_output->setReadOnly(true);
    grid->addWidget(m_output, 8, 1);
    grid->setRowStretch(8, 1);
    grid->setColumnStretch(1, 1);

    auto* buttons = new QHBoxLayout;
    buttons->addStretch();
    auto* generate = new QPushButton(tr("Generate"), this);
    auto* save = new QPushButton(tr("Save..."), this);
    auto* copy = new QPushButton(tr("Copy"), this);
    buttons->addWidget(generate);
    buttons->addWidget(save);
    buttons->addWidget(copy);
    grid->addLayout(buttons, 9, 1);

    connect(generate, &QPushButton::clicked, this, &KeyForm::generateKeys);
    connect(save, &QPushButton::clicked, this, &KeyForm::saveKeys);
    connect(copy, &QPushButton::clicked, this, &KeyForm::copyKeys);

    m_count->setFocus();
}

QLineEdit* KeyForm::addRow(const int row, const QString& label, const QString& value) {
    auto* grid = static_cast<QGridLayout*>(layout());
    grid->addWidget(new QLabel(label, this), row, 0);
    auto* edit = new QLineEdit(value, this);
    grid->addWidget(edit, row, 1);
    return edit;
}

void KeyForm::generateKeys() {
    FormInput input;
    input.count = m_count->text().toStdString();
    input.length = m_length->text().toStdString();
    input.pattern = m_pattern->text().toStdString();
    input.group_size = m_groupSize->text().toStdString();
    input.separator = m_separator->text().toStdString();
    input.alphabet = m_alphabet->text().toStdString();
    input.allow_ambiguous = m_allowAmbiguous->isChecked();
    input.unique = m_unique->isChecked();

    GenerationConfig config;
    std::string error;
    if (ConfigFromForm(input, config, error) != GenStatus::Ok) {
        QMessageBox::critical(this, tr("Error"), QString::fromStdString(error));
        return;
    }

    if (m_log) {
        m_log("[GUI] Starting generation.");
    }
    std::vector<std::string> keys;
    const GenStatus status = KeyGenerator::Generate(config, keys, m_log);
    if (status != GenStatus::Ok) {
        QMessageBox::critical(this, tr("Error"), StatusText(status));
        return;
    }

    m_keys = std::move(keys);
    m_output->setPlainText(JoinKeys(m_keys));
    if (m_log) {
        m_log("[GUI] Generated " + std::to_string(m_keys.size()) + " keys.");
    }
}

void KeyForm::saveKeys() {
    if (m_keys.empty()) {
        QMessageBox::information(this, tr("Nothing to Save"), tr("Generate keys first."));
        return;
    }

    QString path = QFileDialog::getSaveFileName(
        this, tr("Save Keys"), QString(),
        tr("Text file (*.txt);;CSV file (*.csv);;JSON file (*.json);;All files (*)"));
    if (path.isEmpty()) {
        return;
    }
    if (QFileInfo(path).suffix().isEmpty()) {
        path += QStringLiteral(".txt");
    }

    const std::string target = path.toStdString();
    const GenStatus status = KeyWriter::Save(m_keys, target, KeyWriter::FormatFromExtension(target));
    if (status != GenStatus::Ok) {
        QMessageBox::critical(this, tr("Error"), StatusText(status));
        return;
    }
    QMessageBox::information(this, tr("Saved"), tr("Saved %1 keys to:\n%2").arg(m_keys.size()).arg(path));
    if (m_log) {
        m_log("[GUI] Saved: " + target);
    }
}

void KeyForm::copyKeys() {
    if (m_keys.empty()) {
        QMessageBox::information(this, tr("Nothing to Copy"), tr("Generate keys first."));
        return;
    }
    QGuiApplication::clipboard()->setText(JoinKeys(m_keys));
    QMessageBox::information(this, tr("Copied"), tr("Keys copied to clipboard."));
}

int RunKeyForm(int& argc, char* argv[], const LogSink& log) {
    QApplication app(argc, argv);
    KeyForm form(log);
    form.show();
    return app.exec();
}

}  // namespace cdkeygen
