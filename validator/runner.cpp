// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2021 Datadog, Inc.

#include "runner.hpp"
#include "assert.hpp"
#include "docval.h"
#include "utils.hpp"

void test_runner::run_one(const YAML::Node &run)
{
    auto code = run["code"].as<DOCVAL_RET_CODE>();

    // A null input is passed as a null pointer, with an optional length
    const char *value = nullptr;
    std::size_t length = 0;
    std::string input;
    if (run["input"].IsNull()) {
        if (run["length"].IsDefined()) {
            length = run["length"].as<std::size_t>();
        }
    } else {
        input = run["input"].as<std::string>();
        value = input.data();
        length = input.size();
    }

    DOCVAL_DOC_KIND kind = DOCVAL_DOC_UNKNOWN;
    auto retval = docval_validate(value, length, &kind);

    output_ << "input: " << (value == nullptr ? "~" : input) << ", code: "
            << docval_ret_code_to_string(retval) << ", kind: " << to_string(kind) << '\n';

    expect(retval, code);

    if (run["kind"].IsDefined()) {
        expect(kind, run["kind"].as<DOCVAL_DOC_KIND>());
    }

    // Validation must be deterministic
    DOCVAL_DOC_KIND second_kind = DOCVAL_DOC_UNKNOWN;
    expect(docval_validate(value, length, &second_kind), retval);
    expect(second_kind, kind);
}

bool test_runner::run_test(const YAML::Node &runs)
{
    bool passed = false;

    try {
        expect(true, runs.IsDefined());
        expect(true, runs.size() > 0);
        for (auto it = runs.begin(); it != runs.end(); ++it) {
            YAML::Node run = *it;
            expect(true, run.IsMap());
            run_one(run);
        }
        passed = true;
    } catch (const std::exception &e) {
        error_ << e.what();
    } catch (...) {
        error_ << "unknown exception";
    }

    return passed;
}

test_runner::result test_runner::run(const fs::path &file)
{
    output_ = {};
    error_ = {};

    bool passed = false;
    bool expected_fail = false;

    try {
        YAML::Node sample = YAML::Load(read_file(file.c_str()));

        if (sample["expected-fail"].IsDefined()) {
            expected_fail = sample["expected-fail"].as<bool>();
        }

        passed = run_test(sample["runs"]);
    } catch (const std::exception &e) {
        error_ << e.what();
    } catch (...) {
        error_ << "unknown exception";
    }

    return {passed, expected_fail, error_.str(), output_.str()};
}
