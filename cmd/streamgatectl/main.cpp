#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "streamgate/v1.hpp"

using namespace streamgate::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  streamgatectl <addr> get <token>\n"
            << "  streamgatectl <addr> recent [limit]\n"
            << "  streamgatectl <addr> section-list\n"
            << "  streamgatectl <addr> section-create <name> [current]\n"
            << "  streamgatectl <addr> section-delete <name>\n"
            << "  streamgatectl <addr> section-use <name>\n"
            << "  streamgatectl <addr> section-clear\n"
            << "  streamgatectl <addr> purge\n"
            << "  streamgatectl <addr> credits <user_id>\n"
            << "  streamgatectl <addr> add-credits <user_id> <amount>\n"
            << "  streamgatectl <addr> plan [price_per_credit_minor]\n"
            << "  streamgatectl <addr> payee [payee_id|-]\n"
            << "  streamgatectl <addr> payments [pending|submitted|approved|rejected|cancelled]\n"
            << "  streamgatectl <addr> approve <request_id> <admin_id> [note]\n"
            << "  streamgatectl <addr> reject <request_id> <admin_id> [note]\n"
            << "  streamgatectl <addr> premium-add <user_id> [period_days]\n"
            << "  streamgatectl <addr> premium-remove <user_id>\n"
            << "  streamgatectl <addr> premium-list\n";
}

static std::optional<PaymentStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return PAYMENT_STATUS_PENDING;
  if (value == "submitted") return PAYMENT_STATUS_SUBMITTED;
  if (value == "approved") return PAYMENT_STATUS_APPROVED;
  if (value == "rejected") return PAYMENT_STATUS_REJECTED;
  if (value == "cancelled") return PAYMENT_STATUS_CANCELLED;
  return std::nullopt;
}

static const char* StatusName(PaymentStatus status) {
  switch (status) {
    case PAYMENT_STATUS_PENDING:
      return "pending";
    case PAYMENT_STATUS_SUBMITTED:
      return "submitted";
    case PAYMENT_STATUS_APPROVED:
      return "approved";
    case PAYMENT_STATUS_REJECTED:
      return "rejected";
    case PAYMENT_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintSection(const Section& s) {
  std::cout << s.name() << " id=" << s.id() << " members=" << s.member_count() << "\n";
}

static int PrintPayment(const PaymentResponse& resp) {
  if (resp.outcome() != OUTCOME_OK) {
    std::cerr << "outcome=" << Outcome_Name(resp.outcome()) << "\n";
    return 3;
  }
  std::cout << "request=" << resp.request().id() << " status=" << StatusName(resp.request().status()) << " balance=" << resp.balance() << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto catalog_stub = CatalogService::NewStub(channel);
  auto ledger_stub  = LedgerService::NewStub(channel);
  auto admin_stub   = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Catalog
  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetReferenceRequest req;
    req.set_token(argv[3]);

    GetReferenceResponse resp;
    auto                 status = catalog_stub->GetReference(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() != OUTCOME_OK) {
      std::cerr << "not found\n";
      return 3;
    }

    const auto& ref = resp.reference();
    std::cout << "chat=" << ref.primary_locator().chat_id() << " message=" << ref.primary_locator().message_id() << "\n";
    if (ref.has_file_name()) std::cout << "file=" << ref.file_name() << "\n";
    if (ref.has_size_bytes()) std::cout << "size=" << ref.size_bytes() << "\n";
    if (ref.has_section_name()) std::cout << "section=" << ref.section_name() << "\n";
    std::cout << "tier=" << AccessTier_Name(ref.access_tier()) << "\n";
    return 0;
  }

  if (cmd == "recent") {
    ListRecentRequest req;
    req.set_limit(argc >= 4 ? std::stoul(argv[3]) : 20);

    TokenList resp;
    auto      status = catalog_stub->ListRecent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& token : resp.tokens()) std::cout << token << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Sections
  // ------------------------------------------------------------

  if (cmd == "section-list") {
    ListSectionsRequest  req;
    ListSectionsResponse resp;
    auto                 status = admin_stub->ListSections(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& s : resp.sections()) PrintSection(s);
    return 0;
  }

  if (cmd == "section-create") {
    if (argc < 4) return 1;

    CreateSectionRequest req;
    req.set_name(argv[3]);
    req.set_make_current(argc >= 5 && std::string(argv[4]) == "current");

    SectionResponse resp;
    auto            status = admin_stub->CreateSection(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() != OUTCOME_OK) {
      std::cerr << "outcome=" << Outcome_Name(resp.outcome()) << "\n";
      return 3;
    }
    PrintSection(resp.section());
    return 0;
  }

  if (cmd == "section-delete") {
    if (argc < 4) return 1;

    DeleteSectionRequest req;
    req.set_section(argv[3]);

    DeleteSectionResponse resp;
    auto                  status = admin_stub->DeleteSection(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.deleted() ? "deleted" : "not found") << "\n";
    return resp.deleted() ? 0 : 3;
  }

  if (cmd == "section-use") {
    if (argc < 4) return 1;

    SetCurrentSectionRequest req;
    req.set_section(argv[3]);

    SectionResponse resp;
    auto            status = admin_stub->SetCurrentSection(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.outcome() != OUTCOME_OK) {
      std::cerr << "outcome=" << Outcome_Name(resp.outcome()) << "\n";
      return 3;
    }
    PrintSection(resp.section());
    return 0;
  }

  if (cmd == "section-clear") {
    ClearCurrentSectionRequest  req;
    ClearCurrentSectionResponse resp;
    auto                        status = admin_stub->ClearCurrentSection(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "cleared\n";
    return 0;
  }

  if (cmd == "purge") {
    PurgeExpiredRequest  req;
    PurgeExpiredResponse resp;
    auto                 status = admin_stub->PurgeExpired(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "removed=" << resp.removed() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------

  if (cmd == "credits") {
    if (argc < 4) return 1;

    UserRequest req;
    req.set_user_id(std::stoll(argv[3]));

    BalanceResponse resp;
    auto            status = ledger_stub->GetCredits(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "balance=" << resp.balance() << "\n";
    return 0;
  }

  if (cmd == "add-credits") {
    if (argc < 5) return 1;

    AmountRequest req;
    req.set_user_id(std::stoll(argv[3]));
    req.set_amount(std::stoll(argv[4]));

    BalanceResponse resp;
    auto            status = ledger_stub->AddCredits(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "balance=" << resp.balance() << "\n";
    return 0;
  }

  if (cmd == "plan") {
    PayPlan resp;
    grpc::Status status;
    if (argc >= 4) {
      PayPlan req;
      req.set_price_per_credit_minor(std::stoll(argv[3]));
      status = ledger_stub->SetPayPlan(&ctx, req, &resp);
    } else {
      GetPayPlanRequest req;
      status = ledger_stub->GetPayPlan(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << "price_per_credit_minor=" << resp.price_per_credit_minor() << "\n";
    return 0;
  }

  if (cmd == "payee") {
    Payee        resp;
    grpc::Status status;
    if (argc >= 4) {
      Payee req;
      const std::string value = argv[3];
      req.set_payee_id(value == "-" ? "" : value);
      status = ledger_stub->SetPayee(&ctx, req, &resp);
    } else {
      GetPayeeRequest req;
      status = ledger_stub->GetPayee(&ctx, req, &resp);
    }
    if (!status.ok()) return Fail(status);

    std::cout << "payee_id=" << (resp.payee_id().empty() ? "(unset)" : resp.payee_id()) << "\n";
    return 0;
  }

  if (cmd == "payments") {
    ListPaymentRequestsRequest req;
    if (argc >= 4) {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }

    ListPaymentRequestsResponse resp;
    auto                        status = ledger_stub->ListPaymentRequests(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& p : resp.requests()) {
      std::cout << p.id() << " user=" << p.user_id() << " amount=" << p.amount_minor() << " credits=" << p.credits()
                << " status=" << StatusName(p.status()) << "\n";
    }
    return 0;
  }

  if (cmd == "approve" || cmd == "reject") {
    if (argc < 5) return 1;

    SetPaymentStatusRequest req;
    req.set_request_id(std::stoull(argv[3]));
    req.set_admin_id(std::stoll(argv[4]));
    req.set_status(cmd == "approve" ? PAYMENT_STATUS_APPROVED : PAYMENT_STATUS_REJECTED);
    if (argc >= 6) req.set_note(argv[5]);

    PaymentResponse resp;
    auto            status = ledger_stub->SetPaymentStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    return PrintPayment(resp);
  }

  // ------------------------------------------------------------
  // Premium users
  // ------------------------------------------------------------

  if (cmd == "premium-add") {
    if (argc < 4) return 1;

    AddPremiumUserRequest req;
    req.set_user_id(std::stoll(argv[3]));
    if (argc >= 5) req.set_period_days(std::stoul(argv[4]));

    PremiumUser resp;
    auto        status = ledger_stub->AddPremiumUser(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.expires_at_ms() == 0) {
      std::cout << "user=" << resp.user_id() << " lifetime\n";
    } else {
      std::cout << "user=" << resp.user_id() << " expires_at_ms=" << resp.expires_at_ms() << "\n";
    }
    return 0;
  }

  if (cmd == "premium-remove") {
    if (argc < 4) return 1;

    UserRequest req;
    req.set_user_id(std::stoll(argv[3]));

    RemovePremiumUserResponse resp;
    auto                      status = ledger_stub->RemovePremiumUser(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.removed() ? "removed" : "not premium") << "\n";
    return 0;
  }

  if (cmd == "premium-list") {
    ListPremiumUsersRequest  req;
    ListPremiumUsersResponse resp;
    auto                     status = ledger_stub->ListPremiumUsers(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& u : resp.users()) std::cout << u.user_id() << " expires_at_ms=" << u.expires_at_ms() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
