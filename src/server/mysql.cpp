#include "server/mysql.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arbiter::server {
using namespace std;

mysql_conn::mysql_conn(const database &config)
    : config(config) {}

mysql_conn::~mysql_conn() {
    close();
}

void mysql_conn::connect() {
    close();
    conn = mysql_init(nullptr);
    if (!conn) throw database_error("MySQL: mysql_init failed");

    LOG(INFO) << "MySQL: connecting to " << config.host << ":" << config.port << "/" << config.database;
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, "utf8mb4");
    // affected rows 返回匹配到的行数，而不是实际被修改的行数
    if (!mysql_real_connect(conn, config.host.c_str(), config.user.c_str(), config.password.c_str(),
                            config.database.c_str(), config.port, nullptr, CLIENT_FOUND_ROWS)) {
        string message = mysql_error(conn);
        close();
        throw database_error("MySQL: unable to connect: " + message);
    }
}

void mysql_conn::close() {
    if (conn) {
        mysql_close(conn);
        conn = nullptr;
    }
}

void mysql_conn::ensure_connected() {
    if (conn && mysql_ping(conn) == 0) return;
    if (conn) LOG(WARNING) << "MySQL: lost connection: " << mysql_error(conn) << ", reconnecting";
    connect();
}

void mysql_conn::fail(const string &sql) {
    string message = fmt::format("MySQL: {} ({}) in: {}", mysql_error(conn), mysql_errno(conn), sql.substr(0, 200));
    unsigned err = mysql_errno(conn);
    // 连接已断开，下次使用时重连
    if (err == 2006 || err == 2013) close();
    throw database_error(message);
}

uint64_t mysql_conn::execute(const string &sql) {
    if (!conn) throw database_error("MySQL: not connected");
    if (mysql_real_query(conn, sql.data(), sql.size()) != 0) fail(sql);
    if (MYSQL_RES *res = mysql_store_result(conn)) mysql_free_result(res);
    return mysql_affected_rows(conn);
}

vector<mysql_row> mysql_conn::query(const string &sql) {
    if (!conn) throw database_error("MySQL: not connected");
    if (mysql_real_query(conn, sql.data(), sql.size()) != 0) fail(sql);
    MYSQL_RES *res = mysql_store_result(conn);
    if (!res) {
        if (mysql_field_count(conn) == 0) return {};
        fail(sql);
    }

    vector<mysql_row> rows;
    unsigned int fields = mysql_num_fields(res);
    while (MYSQL_ROW row = mysql_fetch_row(res)) {
        unsigned long *lengths = mysql_fetch_lengths(res);
        mysql_row values(fields);
        for (unsigned int i = 0; i < fields; ++i)
            if (row[i]) values[i] = string(row[i], lengths[i]);
        rows.push_back(move(values));
    }
    mysql_free_result(res);
    return rows;
}

string mysql_conn::quote(const string &text) {
    if (!conn) throw database_error("MySQL: not connected");
    string escaped(text.size() * 2 + 1, '\0');
    unsigned long len = mysql_real_escape_string(conn, escaped.data(), text.data(), text.size());
    escaped.resize(len);
    return "'" + escaped + "'";
}

string mysql_conn::quote(const optional<string> &text) {
    return text ? quote(*text) : "NULL";
}

void mysql_conn::begin() {
    execute("START TRANSACTION");
}

void mysql_conn::commit() {
    execute("COMMIT");
}

void mysql_conn::rollback() noexcept {
    if (!conn) return;
    if (mysql_real_query(conn, "ROLLBACK", 8) != 0)
        LOG(ERROR) << "MySQL: rollback failed: " << mysql_error(conn);
}

}  // namespace arbiter::server
