// ---------------------------------------------------------------------------
// statement_splitter.cpp
// ---------------------------------------------------------------------------

#include "parser/statement_splitter.hpp"

#include "parser/sql_normalizer.hpp"  // trim_view

std::vector<std::string_view> StatementSplitter::split(std::string_view normalized_sql) const {
    std::vector<std::string_view> statements;

    std::size_t start = 0;
    while (start <= normalized_sql.size()) {
        const auto semi = normalized_sql.find(';', start);
        const auto end  = (semi == std::string_view::npos) ? normalized_sql.size() : semi;

        const auto candidate = trim_view(normalized_sql.substr(start, end - start));
        if (!candidate.empty()) {
            statements.push_back(candidate);
        }

        if (semi == std::string_view::npos) {
            break;
        }
        start = semi + 1;
    }

    return statements;
}
