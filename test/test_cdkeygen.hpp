#pragma once

#include <qobject.h>
#include <qtest.h>

class CdKeyGenTest : public QObject
{
    Q_OBJECT

private slots: // NOLINT
    void test_alphabet_default();
    void test_alphabet_strips_ambiguous();
    void test_alphabet_dedup_and_whitespace();
    void test_alphabet_too_small();

    void test_capacity_estimate();
    void test_capacity_saturates();

    void test_grouping();

    void test_generate_fixed_length_unique();
    void test_generate_grouped();
    void test_generate_pattern();
    void test_generate_pattern_ignores_grouping();
    void test_generate_lowercase();
    void test_generate_allows_duplicates();
    void test_generate_exhausts_small_keyspace();
    void test_generate_capacity_exceeded();
    void test_generate_invalid_config();
    void test_generate_collision_advisory();
    void test_generate_progress_log();
    void test_generate_huge_count();
    void test_generate_allocation_failure();
    void test_generate_folds_alphabet_case();

    void test_form_defaults();
    void test_form_rejects_bad_input();
    void test_form_pattern_disables_grouping();

    void test_parse_format();
    void test_render_text();
    void test_render_csv_quoting();
    void test_save_json_round_trip();
    void test_save_csv_round_trip();
    void test_save_creates_directories();
    void test_save_unsupported_format();
    void test_save_io_failure();
};
