#include "ServerBackend.hpp"
#include "Errors.hpp"

namespace sqlkit {

QueryResult extractResult(const ServerResult& result) {
    std::optional<QueryResult> extracted = result.columnsAndRows();
    if (!extracted) {
        throw UnsupportedResultError(result.shape());
    }
    normalizeWideIntegers(extracted->rows);
    return std::move(*extracted);
}

}  // namespace sqlkit
