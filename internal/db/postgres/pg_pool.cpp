#include "pg_pool.hpp"

namespace streamgate::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_reference",
               "SELECT token,chat_id,message_id,fallback_locator,unique_id,file_name,mime_type,size_bytes,media_kind,access_tier,"
               "created_at_ms,section_id,section_name,expires_at_ms FROM media_reference "
               "WHERE token=$1 AND (expires_at_ms=0 OR expires_at_ms>$2)");

  conn.prepare("charge_credits", "UPDATE credit_balance SET balance=balance-$2 WHERE user_id=$1 AND balance>=$2 RETURNING balance");

  conn.prepare("add_credits",
               "INSERT INTO credit_balance(user_id,balance) VALUES($1,$2) "
               "ON CONFLICT(user_id) DO UPDATE SET balance=credit_balance.balance+EXCLUDED.balance RETURNING balance");

  conn.prepare("get_credits", "SELECT balance FROM credit_balance WHERE user_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace streamgate::db::postgres
