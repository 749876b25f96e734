#include "docval.h"
#include <array>
#include <cstdint>
#include <iostream>
#include <string_view>

namespace {

void log_cb(DOCVAL_LOG_LEVEL level, const char *function, const char *file, unsigned line,
    const char *message, [[maybe_unused]] uint64_t len)
{
    std::cerr << "[" << level << "][" << file << ":" << function << ":" << line
              << "]: " << message << '\n';
}

std::string_view kind_to_str(DOCVAL_DOC_KIND kind)
{
    switch (kind) {
    case DOCVAL_DOC_CPF:
        return "CPF";
    case DOCVAL_DOC_CNPJ:
        return "CNPJ";
    case DOCVAL_DOC_UNKNOWN:
        break;
    }
    return "Document";
}

} // namespace

int main()
{
    docval_set_log_cb(log_cb, DOCVAL_LOG_WARN);

    std::cout << "docval " << docval_get_version() << '\n';

    constexpr std::array<std::string_view, 4> documents{
        "123.456.789-09", "12.345.678/0001-95", "000.000.000-00", "12.345.678/0001-99"};

    for (auto document : documents) {
        DOCVAL_DOC_KIND kind = DOCVAL_DOC_UNKNOWN;
        auto code = docval_validate(document.data(), document.size(), &kind);
        if (code == DOCVAL_OK) {
            std::cout << kind_to_str(kind) << " " << document << " is valid!\n";
        } else {
            std::cout << kind_to_str(kind) << " " << document
                      << " is invalid: " << docval_ret_code_to_string(code) << '\n';
        }
    }

    return 0;
}
