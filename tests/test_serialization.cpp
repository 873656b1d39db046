/**
 * @file test_serialization.cpp
 * @brief Values that cannot be encoded fail the call and leave the sink untouched.
 */

#include <etrace/etrace.hpp>
#include "test_framework.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>

using etrace::Json;
using test_support::ScratchFile;
using test_support::parse_trace;
using test_support::read_file;

TEST(non_finite_numbers_are_rejected) {
    etrace::Tracer tracer;
    Json nan_args = {{"v", std::numeric_limits<double>::quiet_NaN()}};
    Json inf_args = {{"list", Json::array({1.0, std::numeric_limits<double>::infinity()})}};

    TEST_ASSERT_THROWS(tracer.counter("c", nan_args), etrace::SerializationError, "NaN");
    TEST_ASSERT_THROWS(tracer.instant("i", "g", inf_args), etrace::SerializationError, "nested infinity");
    TEST_ASSERT(tracer.events().empty(), "buffer untouched");
}

TEST(invalid_utf8_is_rejected) {
    etrace::Tracer tracer;
    std::string bad = "abc\xff\xfe";
    Json bad_value = {{"s", bad}};
    Json bad_key = {{bad, 1}};

    TEST_ASSERT_THROWS(tracer.mark("m", bad_value), etrace::SerializationError, "bad string value");
    TEST_ASSERT_THROWS(tracer.mark("m", bad_key), etrace::SerializationError, "bad key");
    TEST_ASSERT_THROWS(tracer.begin(bad), etrace::SerializationError, "bad name");
    TEST_ASSERT(tracer.events().empty(), "buffer untouched");
}

TEST(args_must_be_an_object) {
    etrace::Tracer tracer;
    Json array_args = Json::array({1, 2, 3});
    Json number_args = 5;
    Json null_args = nullptr;

    TEST_ASSERT_THROWS(tracer.counter("c", array_args), etrace::SerializationError, "array");
    TEST_ASSERT_THROWS(tracer.counter("c", number_args), etrace::SerializationError, "number");
    TEST_ASSERT_THROWS(tracer.counter("c", null_args), etrace::SerializationError, "explicit null");
    TEST_ASSERT(tracer.events().empty(), "buffer untouched");
}

TEST(binary_values_are_rejected) {
    etrace::Tracer tracer;
    Json args = {{"blob", Json::binary({1, 2, 3})}};
    TEST_ASSERT_THROWS(tracer.object_snapshot("o", "1", args), etrace::SerializationError, "binary");
}

TEST(failed_event_leaves_stream_file_identical) {
    ScratchFile file("etrace_serial_stream");
    etrace::Tracer tracer(file.path());
    tracer.instant("before");
    std::string snapshot = read_file(file.path());

    Json bad = {{"v", std::nan("")}};
    TEST_ASSERT_THROWS(tracer.instant("bad", "t", bad), etrace::SerializationError, "NaN while streaming");
    TEST_ASSERT_EQ(read_file(file.path()), snapshot, "no bytes written");

    tracer.instant("after");
    Json trace = parse_trace(file.path());
    TEST_ASSERT_EQ(trace.size(), 2u, "stream still usable");
    TEST_ASSERT_EQ(trace[1].at("name"), "after", "next record follows");
}

TEST(error_type_hierarchy) {
    etrace::Tracer tracer;
    Json bad = Json::array();
    bool caught = false;
    try {
        tracer.mark("m", bad);
    }
    catch (const etrace::Error& e) {
        caught = true;
        TEST_ASSERT(std::string(e.what()).find("object") != std::string::npos, "message names the problem");
    }
    TEST_ASSERT(caught, "SerializationError is an etrace::Error");
}

TEST(unicode_text_is_encoded) {
    etrace::Tracer tracer;
    tracer.instant("caf\xc3\xa9", "p", Json{{"quote", "say \"hi\"\n"}});

    std::ostringstream os;
    os << tracer;
    Json j = Json::parse(os.str());
    TEST_ASSERT_EQ(j.at("name"), "caf\xc3\xa9", "UTF-8 name kept");
    TEST_ASSERT_EQ(j.at("args").at("quote"), "say \"hi\"\n", "escapes round trip");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
