#pragma once

#include <libpq-fe.h>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace db {

struct DbResult {
    bool ok = false;
    std::string sqlstate;
    std::string message;
    std::vector<std::string> columns;
    std::vector<std::vector<std::optional<std::string>>> rows;
    int affected_rows = 0;

    // -1 when the column is not part of the result
    int column_index(const std::string& name) const;
};

using DbResultCb = std::function<void(const boost::system::error_code&, DbResult)>;

// SQLSTATE for unique_violation
inline constexpr const char* kUniqueViolation = "23505";

// Fixed set of worker threads, each holding one long-lived PGconn.
// Callbacks are always posted back to the application io_context.
class DbPool {
public:
    DbPool(boost::asio::io_context& app_ioc, const std::string& conninfo, int workers = 4);
    ~DbPool();

    DbPool(const DbPool&) = delete;
    DbPool& operator=(const DbPool&) = delete;

    void async_exec(const std::string& sql, DbResultCb cb);

    void async_exec_params(const std::string& sql, std::vector<std::string> params, DbResultCb cb);

    // Runs the statements in order on one connection and stops at the first
    // non-ok result, which is the one delivered. Statements listed in
    // `tolerated` may fail without stopping the script.
    void async_exec_script(std::vector<std::string> statements, std::vector<size_t> tolerated, DbResultCb cb);

    using ScalarIntCb = std::function<void(const boost::system::error_code&, int)>;
    void async_scalar_int(const std::string& sql, ScalarIntCb cb);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
