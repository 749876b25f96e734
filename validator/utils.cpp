// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2021 Datadog, Inc.

#include "utils.hpp"
#include "docval.h"
#include <iostream>
#include <system_error>
#include <unistd.h>

using namespace std::literals;

namespace YAML {

DOCVAL_RET_CODE as_if<DOCVAL_RET_CODE, void>::operator()() const
{
    if (node.Type() != NodeType::Scalar) {
        throw parsing_error("Invalid node type, expected a return code");
    }

    const std::string &value = node.Scalar();
    if (value == "ok") {
        return DOCVAL_OK;
    }
    if (value == "invalid_input") {
        return DOCVAL_INVALID_INPUT;
    }
    if (value == "invalid_length") {
        return DOCVAL_INVALID_LENGTH;
    }
    if (value == "all_digits_equal") {
        return DOCVAL_ALL_DIGITS_EQUAL;
    }
    if (value == "invalid_checksum") {
        return DOCVAL_INVALID_CHECKSUM;
    }
    if (value == "invalid_argument") {
        return DOCVAL_ERR_INVALID_ARGUMENT;
    }
    if (value == "internal_error") {
        return DOCVAL_ERR_INTERNAL;
    }

    throw parsing_error("Unknown return code: " + value);
}

DOCVAL_DOC_KIND as_if<DOCVAL_DOC_KIND, void>::operator()() const
{
    if (node.Type() != NodeType::Scalar) {
        throw parsing_error("Invalid node type, expected a document kind");
    }

    const std::string &value = node.Scalar();
    if (value == "cpf") {
        return DOCVAL_DOC_CPF;
    }
    if (value == "cnpj") {
        return DOCVAL_DOC_CNPJ;
    }
    if (value == "unknown") {
        return DOCVAL_DOC_UNKNOWN;
    }

    throw parsing_error("Unknown document kind: " + value);
}
} // namespace YAML

std::string read_file(std::string_view filename)
{
    std::ifstream file(filename.data(), std::ios::in);
    if (!file) {
        throw std::system_error(errno, std::generic_category());
    }

    // Create a buffer equal to the file size
    std::string buffer;
    file.seekg(0, std::ios::end);
    buffer.resize(file.tellg());
    file.seekg(0, std::ios::beg);

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    file.close();
    return buffer;
}

std::string_view to_string(DOCVAL_DOC_KIND kind)
{
    switch (kind) {
    case DOCVAL_DOC_CPF:
        return "cpf"sv;
    case DOCVAL_DOC_CNPJ:
        return "cnpj"sv;
    case DOCVAL_DOC_UNKNOWN:
        break;
    }
    return "unknown"sv;
}

namespace term {

bool has_colour() { return isatty(fileno(stdout)) != 0; }

} // namespace term

std::ostream &operator<<(std::ostream &os, term::colour c)
{
    // Attempt to verify if ostream is cout
    if (os.rdbuf() != std::cout.rdbuf() || !term::has_colour()) {
        return os;
    }

    os << "\033[" << static_cast<std::underlying_type<term::colour>::type>(c) << "m";
    return os;
}
