#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"

#include "configuration/schema_diagnostics.hpp"
#include "configuration/schema_parser.hpp"
#include "exception.hpp"
#include "validation/schema.hpp"

using namespace rapidjson;

namespace {

constexpr std::string_view default_schema = R"({
    "version": "1",
    "fields": [
        {"id": "citizen", "field": "cpf", "kind": "cpf", "required": false},
        {"id": "company", "field": "cnpj", "kind": "cnpj", "required": false}
    ]
})";

constexpr std::string_view default_records[] = {
    R"({"cpf": "123.456.789-09"})",
    R"({"cnpj": "12.345.678/0001-95"})",
    R"({"cpf": "000.000.000-00"})",
    R"({"cnpj": "12.345.678/0001-99"})",
};

std::string read_file(const std::string_view &filename)
{
    std::ifstream rule_file(filename.data(), std::ios::in);
    if (!rule_file) {
        throw std::system_error(errno, std::generic_category());
    }

    std::string buffer;
    rule_file.seekg(0, std::ios::end);
    buffer.resize(rule_file.tellg());
    rule_file.seekg(0, std::ios::beg);

    rule_file.read(&buffer[0], static_cast<std::streamsize>(buffer.size()));
    rule_file.close();
    return buffer;
}

void print_errors(const docval::validation_errors &errors)
{
    StringBuffer sb;
    PrettyWriter<StringBuffer> w(sb);

    w.StartObject();
    for (const auto &[field, field_errors] : errors.fields()) {
        w.Key(field.c_str());
        w.StartArray();
        for (const auto &error : field_errors) {
            w.StartObject();
            w.Key("code");
            w.String(error.code.c_str());
            w.Key("message");
            w.String(error.message.c_str());
            w.Key("params");
            w.StartObject();
            for (const auto &[key, value] : error.params) {
                w.Key(key.c_str());
                w.String(value.c_str());
            }
            w.EndObject();
            w.EndObject();
        }
        w.EndArray();
    }
    w.EndObject();

    std::cout << "Validation errors: " << sb.GetString() << '\n';
}

bool validate(const docval::schema &schema, std::string_view record)
{
    auto errors = schema.validate(record);
    if (errors.empty()) {
        std::cout << "Record " << record << " is valid!\n";
        return true;
    }

    std::cout << "Record " << record << " is invalid\n";
    print_errors(errors);
    return false;
}

} // namespace

int main(int argc, char *argv[])
{
    if (argc == 2 || argc > 3) {
        std::cerr << "Usage " << argv[0] << " [<schema> <record>]\n";
        return EXIT_FAILURE;
    }

    try {
        docval::schema_diagnostics diagnostics;
        if (argc == 3) {
            auto schema = docval::parse_schema(read_file(argv[1]), diagnostics);
            for (const auto &[error, ids] : diagnostics.errors()) {
                for (const auto &id : ids) { std::cerr << "Skipped rule " << id << ": " << error << '\n'; }
            }
            return validate(schema, read_file(argv[2])) ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        auto schema = docval::parse_schema(default_schema, diagnostics);
        for (auto record : default_records) { validate(schema, record); }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
