#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>
#include <string_view>

#include "internal/core/store_support.hpp"
#include "internal/core/token_store.hpp"
#include "internal/model/payment_state.hpp"
#include "internal/observability/logging.hpp"

namespace streamgate::core {

using namespace streamgate::v1;
using detail::ThrowIfDbError;

namespace {

constexpr const char* kPricePerCreditKey = "pay_plan.price_per_credit_minor";
constexpr const char* kPayeeIdKey         = "pay_plan.payee_id";

constexpr uint64_t kDefaultPaymentListLimit = 20;
constexpr uint64_t kMaxPaymentListLimit     = 100;
constexpr size_t   kMinReferenceNoteLength  = 6;

void RequireUser(int64_t user_id) {
  if (user_id <= 0) {
    throw util::InvalidArgument("user id must be positive");
  }
}

std::string Trim(const std::string& s) {
  const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  const auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::optional<int64_t> ParseInt(const std::string& s) {
  int64_t value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace

// ------------------------------------------------------------------
// Credits
// ------------------------------------------------------------------

int64_t TokenStore::GetCredits(int64_t user_id) {
  auto tx      = repository_->Begin();
  auto balance = repository_->GetCredits(*tx, user_id);
  tx->Commit();
  return balance;
}

int64_t TokenStore::AddCredits(int64_t user_id, int64_t amount) {
  RequireUser(user_id);
  if (amount < 0) {
    throw util::InvalidArgument("credit amount must not be negative");
  }

  int64_t balance = 0;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->AddCredits(*tx, user_id, amount, balance), "add credits");
  tx->Commit();
  return balance;
}

ChargeOutcome TokenStore::ChargeCredits(int64_t user_id, int64_t amount) {
  RequireUser(user_id);

  ChargeOutcome outcome;
  if (amount <= 0) {
    outcome.ok      = true;
    outcome.balance = GetCredits(user_id);
    return outcome;
  }

  auto       tx      = repository_->Begin();
  const auto charged = repository_->ChargeCredits(*tx, user_id, amount, outcome.balance);
  if (charged.Is(db::ErrorCode::Conflict)) {
    tx->Rollback();
    return outcome;
  }
  ThrowIfDbError(charged, "charge credits");
  tx->Commit();

  outcome.ok = true;
  return outcome;
}

int64_t TokenStore::RefundCredits(int64_t user_id, int64_t amount) {
  const auto balance = AddCredits(user_id, amount);
  STREAMGATE_LOG_INFO("credits refunded", {observability::IntField("user_id", user_id), observability::IntField("amount", amount),
                                           observability::IntField("balance", balance)});
  return balance;
}

std::vector<CreditBalance> TokenStore::ListCreditBalances(uint64_t limit) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListCreditBalances(*tx, limit == 0 ? kMaxPaymentListLimit : limit);
  tx->Commit();

  std::vector<CreditBalance> balances;
  balances.reserve(records.size());
  for (const auto& record : records) {
    CreditBalance balance;
    balance.set_user_id(record.user_id);
    balance.set_balance(record.balance);
    balances.push_back(std::move(balance));
  }
  return balances;
}

// ------------------------------------------------------------------
// Pay plan
// ------------------------------------------------------------------

int64_t TokenStore::CreditsForAmount(int64_t amount_minor, int64_t price_per_credit_minor) {
  if (price_per_credit_minor <= 0 || amount_minor <= 0) {
    return 0;
  }
  return amount_minor / price_per_credit_minor;
}

int64_t TokenStore::GetPricePerCredit() {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetSetting(*tx, kPricePerCreditKey);
  tx->Commit();

  if (stored) {
    if (auto price = ParseInt(*stored); price && *price > 0) {
      return *price;
    }
    STREAMGATE_LOG_WARN("ignoring malformed pay plan setting", {observability::StringField("value", *stored)});
  }
  return options_.default_price_per_credit_minor;
}

int64_t TokenStore::SetPricePerCredit(int64_t price_minor) {
  if (price_minor <= 0) {
    throw util::InvalidArgument("price per credit must be positive");
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutSetting(*tx, kPricePerCreditKey, std::to_string(price_minor)), "set pay plan");
  tx->Commit();

  STREAMGATE_LOG_INFO("pay plan updated", {observability::IntField("price_per_credit_minor", price_minor)});
  return price_minor;
}

bool TokenStore::ValidPayeeId(const std::string& payee_id) {
  const auto at = payee_id.find('@');
  if (at == std::string::npos || payee_id.find('@', at + 1) != std::string::npos) {
    return false;
  }
  const auto name     = std::string_view(payee_id).substr(0, at);
  const auto provider = std::string_view(payee_id).substr(at + 1);
  if (name.size() < 2 || provider.size() < 2) {
    return false;
  }
  const bool name_ok = std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isalnum(c) || c == '.' || c == '_' || c == '-'; });
  const bool provider_ok = std::all_of(provider.begin(), provider.end(), [](unsigned char c) { return std::isalpha(c); });
  return name_ok && provider_ok;
}

std::optional<std::string> TokenStore::GetPayeeId() {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetSetting(*tx, kPayeeIdKey);
  tx->Commit();

  if (!stored || stored->empty()) {
    return std::nullopt;
  }
  return stored;
}

void TokenStore::SetPayeeId(const std::optional<std::string>& payee_id) {
  const auto value = payee_id ? Trim(*payee_id) : std::string();
  if (!value.empty() && !ValidPayeeId(value)) {
    throw util::InvalidArgument("payee id must look like name@provider");
  }

  // An empty value reads back as unset.
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutSetting(*tx, kPayeeIdKey, value), "set payee id");
  tx->Commit();

  STREAMGATE_LOG_INFO("payee id updated", {observability::StringField("payee_id", value.empty() ? "-" : value)});
}

// ------------------------------------------------------------------
// Payment requests
// ------------------------------------------------------------------

PaymentRequest TokenStore::CreatePaymentRequest(int64_t user_id, int64_t amount_minor, int64_t credits) {
  RequireUser(user_id);
  if (amount_minor <= 0) {
    throw util::InvalidArgument("payment amount must be positive");
  }
  if (credits < 0) {
    throw util::InvalidArgument("credits must not be negative");
  }
  if (credits == 0) {
    credits = CreditsForAmount(amount_minor, GetPricePerCredit());
    if (credits < 1) {
      throw util::InvalidArgument("amount buys less than one credit");
    }
  }

  db::model::PaymentRecord record;
  record.user_id       = user_id;
  record.amount_minor  = amount_minor;
  record.credits       = credits;
  record.status        = PAYMENT_STATUS_PENDING;
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertPayment(*tx, record), "create payment request");
  tx->Commit();

  STREAMGATE_LOG_INFO("payment request created", {observability::UintField("request_id", record.id), observability::IntField("user_id", user_id),
                                                  observability::IntField("amount_minor", amount_minor), observability::IntField("credits", credits)});
  return detail::ToProto(record);
}

PaymentOutcome TokenStore::SubmitPayment(uint64_t request_id, int64_t user_id, const std::string& reference_note) {
  const auto note = Trim(reference_note);
  if (note.size() < kMinReferenceNoteLength) {
    throw util::InvalidArgument("payment reference is too short");
  }

  PaymentOutcome outcome;

  auto tx      = repository_->Begin();
  auto current = repository_->GetPayment(*tx, request_id);
  if (!current) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kNotFound;
    return outcome;
  }
  outcome.request = detail::ToProto(*current);
  outcome.balance = repository_->GetCredits(*tx, current->user_id);

  if (current->user_id != user_id) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAccessDenied;
    return outcome;
  }
  if (model::IsTerminal(current->status)) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAlreadyFinalized;
    return outcome;
  }
  if (!model::CanTransition(current->status, PAYMENT_STATUS_SUBMITTED)) {
    tx->Rollback();
    throw util::InvalidState("payment request " + std::to_string(request_id) + " was already submitted");
  }

  auto updated          = *current;
  updated.status        = PAYMENT_STATUS_SUBMITTED;
  updated.note          = note;
  updated.updated_at_ms = NowMs();

  const auto swapped = repository_->CompareAndSetPayment(*tx, updated, current->status);
  if (swapped.Is(db::ErrorCode::Conflict)) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAlreadyFinalized;
    return outcome;
  }
  ThrowIfDbError(swapped, "submit payment");
  ThrowIfDbError(repository_->DeletePendingSubmission(*tx, user_id), "clear pending submission");
  tx->Commit();

  STREAMGATE_LOG_INFO("payment status changed", {observability::UintField("request_id", request_id), observability::StringField("from", PaymentStatus_Name(current->status)),
                                                 observability::StringField("to", PaymentStatus_Name(updated.status))});
  outcome.request = detail::ToProto(updated);
  return outcome;
}

PaymentOutcome TokenStore::SetPaymentStatus(uint64_t request_id, PaymentStatus status, const std::string& note, int64_t admin_id) {
  if (!PaymentStatus_IsValid(status) || status == PAYMENT_STATUS_PENDING) {
    throw util::InvalidArgument("payment requests cannot be moved to " + PaymentStatus_Name(status));
  }

  PaymentOutcome outcome;

  auto tx      = repository_->Begin();
  auto current = repository_->GetPayment(*tx, request_id);
  if (!current) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kNotFound;
    return outcome;
  }
  outcome.request = detail::ToProto(*current);

  if (model::IsTerminal(current->status)) {
    outcome.balance = repository_->GetCredits(*tx, current->user_id);
    tx->Rollback();
    outcome.error = util::ErrorKind::kAlreadyFinalized;
    return outcome;
  }
  if (!model::CanTransition(current->status, status)) {
    tx->Rollback();
    throw util::InvalidState("payment request " + std::to_string(request_id) + " cannot move from " + PaymentStatus_Name(current->status) + " to " +
                             PaymentStatus_Name(status));
  }

  auto updated          = *current;
  updated.status        = status;
  updated.note          = Trim(note);
  updated.handled_by    = admin_id;
  updated.updated_at_ms = NowMs();

  const auto swapped = repository_->CompareAndSetPayment(*tx, updated, current->status);
  if (swapped.Is(db::ErrorCode::Conflict)) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAlreadyFinalized;
    return outcome;
  }
  ThrowIfDbError(swapped, "set payment status");

  if (status == PAYMENT_STATUS_APPROVED) {
    ThrowIfDbError(repository_->AddCredits(*tx, current->user_id, current->credits, outcome.balance), "grant payment credits");
  } else {
    outcome.balance = repository_->GetCredits(*tx, current->user_id);
  }

  // Submitted and terminal requests both refuse a reference, so a pointer at
  // this request is dead either way. A pointer at another request survives.
  if (auto pending = repository_->GetPendingSubmission(*tx, current->user_id, NowMs()); pending && pending->request_id == request_id) {
    ThrowIfDbError(repository_->DeletePendingSubmission(*tx, current->user_id), "clear pending submission");
  }
  tx->Commit();

  STREAMGATE_LOG_INFO("payment status changed", {observability::UintField("request_id", request_id), observability::StringField("from", PaymentStatus_Name(current->status)),
                                                 observability::StringField("to", PaymentStatus_Name(status)), observability::IntField("admin_id", admin_id),
                                                 observability::IntField("balance", outcome.balance)});
  outcome.request = detail::ToProto(updated);
  return outcome;
}

std::optional<PaymentRequest> TokenStore::GetPaymentRequest(uint64_t request_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPayment(*tx, request_id);
  tx->Commit();
  if (!record) return std::nullopt;
  return detail::ToProto(*record);
}

std::vector<PaymentRequest> TokenStore::ListPaymentRequests(std::optional<PaymentStatus> status, uint64_t limit) {
  if (limit == 0) {
    limit = kDefaultPaymentListLimit;
  }
  limit = std::min(limit, kMaxPaymentListLimit);

  auto tx      = repository_->Begin();
  auto records = repository_->ListPayments(*tx, status, limit);
  tx->Commit();

  std::vector<PaymentRequest> requests;
  requests.reserve(records.size());
  for (const auto& record : records) {
    requests.push_back(detail::ToProto(record));
  }
  return requests;
}

PaymentOutcome TokenStore::SetPendingSubmission(int64_t user_id, uint64_t request_id) {
  RequireUser(user_id);

  PaymentOutcome outcome;

  auto tx      = repository_->Begin();
  auto current = repository_->GetPayment(*tx, request_id);
  if (!current) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kNotFound;
    return outcome;
  }
  outcome.request = detail::ToProto(*current);
  outcome.balance = repository_->GetCredits(*tx, current->user_id);

  if (current->user_id != user_id) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAccessDenied;
    return outcome;
  }
  if (model::IsTerminal(current->status)) {
    tx->Rollback();
    outcome.error = util::ErrorKind::kAlreadyFinalized;
    return outcome;
  }

  db::model::PendingSubmissionRecord pending;
  pending.user_id       = user_id;
  pending.request_id    = request_id;
  pending.expires_at_ms = NowMs() + static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.pending_submission_ttl).count());

  ThrowIfDbError(repository_->PutPendingSubmission(*tx, pending), "set pending submission");
  tx->Commit();
  return outcome;
}

std::optional<uint64_t> TokenStore::PendingSubmission(int64_t user_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetPendingSubmission(*tx, user_id, NowMs());
  tx->Commit();
  if (!record) return std::nullopt;
  return record->request_id;
}

} // namespace streamgate::core
