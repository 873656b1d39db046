/**
 * @file test_config_file.cpp
 * @brief INI configuration loading.
 *
 * Tests include:
 * 1. Full file with every option
 * 2. Partial file keeps defaults
 * 3. Comments, quotes and case handling
 * 4. Malformed lines and unknown keys are warned about and skipped
 * 5. Missing file
 * 6. Loaded config driving a tracer
 * 7. Lines longer than any read buffer
 */

#include <etrace/etrace.hpp>
#include "test_framework.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <string>

#ifndef ETRACE_TEST_DATA_DIR
#define ETRACE_TEST_DATA_DIR "../tests"
#endif

using test_support::ScratchFile;
using test_support::parse_trace;

namespace {

std::string fixture(const char* name) {
    return std::string(ETRACE_TEST_DATA_DIR) + "/config/" + name;
}

/**
 * @brief Collects warnings written to a Config's log stream.
 */
class WarningCapture {
public:
    WarningCapture() : f_(std::tmpfile()) {}
    ~WarningCapture() {
        if (f_) std::fclose(f_);
    }

    FILE* stream() const { return f_; }

    std::string text() const {
        std::string out;
        std::rewind(f_);
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), f_)) > 0) {
            out.append(buf, n);
        }
        return out;
    }

    int count() const {
        std::string t = text();
        int lines = 0;
        for (size_t pos = t.find("etrace: Warning: "); pos != std::string::npos;
             pos = t.find("etrace: Warning: ", pos + 1)) {
            ++lines;
        }
        return lines;
    }

private:
    FILE* f_;
};

} // namespace

TEST(defaults_are_buffered) {
    etrace::Config cfg;
    TEST_ASSERT(cfg.output_path.empty(), "no output path");
    TEST_ASSERT(cfg.mode() == etrace::TracingMode::Buffered, "buffered by default");
    TEST_ASSERT_EQ(cfg.lock_appends, true, "locking on");
    TEST_ASSERT_EQ(cfg.create_directories, false, "no directory creation");
    TEST_ASSERT_EQ(cfg.warn_unbalanced, true, "unbalanced warning on");
    TEST_ASSERT_EQ(cfg.warn_unflushed, false, "unflushed warning off");
    TEST_ASSERT(cfg.log_out == stderr, "warnings to stderr");
}

TEST(load_full_config) {
    WarningCapture warnings;
    etrace::Config cfg;
    cfg.log_out = warnings.stream();

    bool ok = cfg.load_from_file(fixture("full.ini").c_str());
    TEST_ASSERT(ok, "file loaded");
    TEST_ASSERT_EQ(cfg.output_path, "traces/run.json", "quoted path unquoted");
    TEST_ASSERT(cfg.mode() == etrace::TracingMode::Streaming, "path selects streaming");
    TEST_ASSERT_EQ(cfg.lock_appends, false, "lock = false");
    TEST_ASSERT_EQ(cfg.create_directories, true, "create_dirs = yes");
    TEST_ASSERT_EQ(cfg.warn_unbalanced, false, "warn_unbalanced = off");
    TEST_ASSERT_EQ(cfg.warn_unflushed, true, "warn_unflushed = 1");
    TEST_ASSERT_EQ(warnings.count(), 0, "no warnings");
}

TEST(load_partial_config) {
    etrace::Config cfg;
    cfg.lock_appends = false;

    bool ok = cfg.load_from_file(fixture("partial.ini").c_str());
    TEST_ASSERT(ok, "file loaded");
    TEST_ASSERT_EQ(cfg.warn_unflushed, true, "section name is case-insensitive");
    TEST_ASSERT_EQ(cfg.lock_appends, false, "absent key keeps current value");
    TEST_ASSERT(cfg.output_path.empty(), "absent path keeps buffered mode");
}

TEST(comments_and_quotes) {
    WarningCapture warnings;
    etrace::Config cfg;
    cfg.log_out = warnings.stream();
    cfg.lock_appends = false;

    TEST_ASSERT(cfg.load_from_file(fixture("comments.ini").c_str()), "file loaded");
    TEST_ASSERT_EQ(cfg.output_path, "my trace #1.json", "comment character inside quotes kept");
    TEST_ASSERT_EQ(cfg.lock_appends, true, "uppercase boolean with trailing comment");
    TEST_ASSERT_EQ(warnings.count(), 0, "no warnings");
}

TEST(malformed_lines_are_skipped_with_warnings) {
    WarningCapture warnings;
    etrace::Config cfg;
    cfg.log_out = warnings.stream();

    TEST_ASSERT(cfg.load_from_file(fixture("malformed.ini").c_str()), "file still loads");
    TEST_ASSERT_EQ(cfg.lock_appends, true, "invalid boolean leaves value");
    TEST_ASSERT_EQ(cfg.create_directories, true, "valid lines after bad ones applied");

    std::string text = warnings.text();
    TEST_ASSERT_EQ(warnings.count(), 5, "orphan, no '=', bad bool, unknown key, unknown section");
    TEST_ASSERT(text.find("'maybe'") != std::string::npos, "bad value named");
    TEST_ASSERT(text.find("colour") != std::string::npos, "unknown key named");
    TEST_ASSERT(text.find("malformed.ini:") != std::string::npos, "file and line reported");
}

TEST(long_lines_are_read_whole) {
    WarningCapture warnings;
    ScratchFile ini("etrace_long_lines");
    std::string long_path = "traces/" + std::string(3000, 'p') + ".json";
    test_support::write_file(ini.path(),
                             "# " + std::string(2000, '-') + "\n"
                             "[output]\n"
                             "path = \"" + long_path + "\"\n"
                             "lock = false");

    etrace::Config cfg;
    cfg.log_out = warnings.stream();
    TEST_ASSERT(cfg.load_from_file(ini.path().c_str()), "file loaded");
    TEST_ASSERT_EQ(cfg.output_path, long_path, "path kept whole");
    TEST_ASSERT_EQ(cfg.lock_appends, false, "last line without newline applied");
    TEST_ASSERT_EQ(warnings.count(), 0, "no warnings");
}

TEST(missing_file) {
    WarningCapture warnings;
    etrace::Config cfg;
    cfg.log_out = warnings.stream();

    bool ok = cfg.load_from_file(fixture("does_not_exist.ini").c_str());
    TEST_ASSERT(!ok, "load reports failure");
    TEST_ASSERT_EQ(warnings.count(), 1, "one warning");
    TEST_ASSERT(cfg.output_path.empty(), "config unchanged");

    TEST_ASSERT_THROWS(etrace::load_config(fixture("does_not_exist.ini")), etrace::ResourceError,
                       "load_config throws");
}

TEST(loaded_config_drives_tracer) {
    ScratchFile file("etrace_config_stream");
    etrace::Config cfg = etrace::load_config(fixture("full.ini"));
    cfg.output_path = file.path();   // override after loading

    etrace::Tracer tracer(cfg);
    TEST_ASSERT(tracer.mode() == etrace::TracingMode::Streaming, "streaming from config");
    TEST_ASSERT_EQ(tracer.config().lock_appends, false, "settings carried");
    tracer.instant("configured");
    TEST_ASSERT_EQ(parse_trace(file.path()).size(), 1u, "record written");
}

TEST(destructor_warnings_follow_config) {
    WarningCapture warnings;
    {
        etrace::Config cfg;
        cfg.log_out = warnings.stream();
        cfg.warn_unflushed = true;
        etrace::Tracer tracer(cfg);
        tracer.begin("left open");
    }
    std::string text = warnings.text();
    TEST_ASSERT(text.find("1 open span") != std::string::npos, "unbalanced span reported");
    TEST_ASSERT(text.find("1 unflushed event") != std::string::npos, "unflushed record reported");

    WarningCapture quiet;
    {
        etrace::Config cfg;
        cfg.log_out = quiet.stream();
        cfg.warn_unbalanced = false;
        etrace::Tracer tracer(cfg);
        tracer.begin("left open");
    }
    TEST_ASSERT_EQ(quiet.count(), 0, "warnings disabled");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
