#include "ledger_service.hpp"

#include "internal/core/access_policy.hpp"
#include "internal/core/token_store.hpp"
#include "internal/service/rpc_support.hpp"

namespace streamgate::service {

using namespace streamgate::v1;

namespace {

PaymentResponse ToResponse(const core::PaymentOutcome& outcome) {
  PaymentResponse resp;
  resp.set_outcome(ToOutcome(outcome.error));
  *resp.mutable_request() = outcome.request;
  resp.set_balance(outcome.balance);
  return resp;
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BalanceResponse LedgerService::GetCredits(const UserRequest& req) {
  return ObserveRpc("LedgerService.GetCredits", [&] {
    BalanceResponse resp;
    resp.set_balance(ctx_.store->GetCredits(req.user_id()));
    return resp;
  });
}

BalanceResponse LedgerService::AddCredits(const AmountRequest& req) {
  return ObserveRpc("LedgerService.AddCredits", [&] {
    BalanceResponse resp;
    resp.set_balance(ctx_.store->AddCredits(req.user_id(), req.amount()));
    return resp;
  });
}

ChargeResponse LedgerService::ChargeCredits(const AmountRequest& req) {
  return ObserveRpc("LedgerService.ChargeCredits", [&] {
    const auto     charge = ctx_.store->ChargeCredits(req.user_id(), req.amount());
    ChargeResponse resp;
    resp.set_ok(charge.ok);
    resp.set_balance(charge.balance);
    return resp;
  });
}

ListBalancesResponse LedgerService::ListBalances(const ListBalancesRequest& req) {
  return ObserveRpc("LedgerService.ListBalances", [&] {
    ListBalancesResponse resp;
    for (auto& balance : ctx_.store->ListCreditBalances(req.limit())) {
      *resp.add_balances() = std::move(balance);
    }
    return resp;
  });
}

PayPlan LedgerService::GetPayPlan(const GetPayPlanRequest&) {
  return ObserveRpc("LedgerService.GetPayPlan", [&] {
    PayPlan plan;
    plan.set_price_per_credit_minor(ctx_.store->GetPricePerCredit());
    return plan;
  });
}

PayPlan LedgerService::SetPayPlan(const PayPlan& req) {
  return ObserveRpc("LedgerService.SetPayPlan", [&] {
    PayPlan plan;
    plan.set_price_per_credit_minor(ctx_.store->SetPricePerCredit(req.price_per_credit_minor()));
    return plan;
  });
}

Payee LedgerService::GetPayee(const GetPayeeRequest&) {
  return ObserveRpc("LedgerService.GetPayee", [&] {
    Payee payee;
    payee.set_payee_id(ctx_.store->GetPayeeId().value_or(""));
    return payee;
  });
}

Payee LedgerService::SetPayee(const Payee& req) {
  return ObserveRpc("LedgerService.SetPayee", [&] {
    ctx_.store->SetPayeeId(req.payee_id());
    Payee payee;
    payee.set_payee_id(ctx_.store->GetPayeeId().value_or(""));
    return payee;
  });
}

PaymentResponse LedgerService::CreatePaymentRequest(const CreatePaymentRequestRequest& req) {
  return ObserveRpc("LedgerService.CreatePaymentRequest", [&] {
    if (!ctx_.store->GetPayeeId()) {
      throw util::InvalidState("no payee id configured");
    }
    PaymentResponse resp;
    resp.set_outcome(OUTCOME_OK);
    *resp.mutable_request() = ctx_.store->CreatePaymentRequest(req.user_id(), req.amount_minor(), req.credits());
    resp.set_balance(ctx_.store->GetCredits(req.user_id()));
    return resp;
  });
}

PaymentResponse LedgerService::SubmitPayment(const SubmitPaymentRequest& req) {
  return ObserveRpc("LedgerService.SubmitPayment",
                    [&] { return ToResponse(ctx_.store->SubmitPayment(req.request_id(), req.user_id(), req.reference_note())); });
}

PaymentResponse LedgerService::SetPaymentStatus(const SetPaymentStatusRequest& req) {
  return ObserveRpc("LedgerService.SetPaymentStatus",
                    [&] { return ToResponse(ctx_.store->SetPaymentStatus(req.request_id(), req.status(), req.note(), req.admin_id())); });
}

PaymentResponse LedgerService::GetPaymentRequest(const GetPaymentRequestRequest& req) {
  return ObserveRpc("LedgerService.GetPaymentRequest", [&] {
    PaymentResponse resp;
    auto            request = ctx_.store->GetPaymentRequest(req.request_id());
    if (!request) {
      resp.set_outcome(OUTCOME_NOT_FOUND);
      return resp;
    }
    resp.set_outcome(OUTCOME_OK);
    resp.set_balance(ctx_.store->GetCredits(request->user_id()));
    *resp.mutable_request() = std::move(*request);
    return resp;
  });
}

ListPaymentRequestsResponse LedgerService::ListPaymentRequests(const ListPaymentRequestsRequest& req) {
  return ObserveRpc("LedgerService.ListPaymentRequests", [&] {
    std::optional<PaymentStatus> status;
    if (req.has_status()) status = req.status();

    ListPaymentRequestsResponse resp;
    for (auto& request : ctx_.store->ListPaymentRequests(status, req.limit())) {
      *resp.add_requests() = std::move(request);
    }
    return resp;
  });
}

PaymentResponse LedgerService::SetPendingSubmission(const SetPendingSubmissionRequest& req) {
  return ObserveRpc("LedgerService.SetPendingSubmission", [&] { return ToResponse(ctx_.store->SetPendingSubmission(req.user_id(), req.request_id())); });
}

PendingSubmissionResponse LedgerService::GetPendingSubmission(const UserRequest& req) {
  return ObserveRpc("LedgerService.GetPendingSubmission", [&] {
    PendingSubmissionResponse resp;
    if (auto request_id = ctx_.store->PendingSubmission(req.user_id())) {
      resp.set_present(true);
      resp.set_request_id(*request_id);
    }
    return resp;
  });
}

AuthorizeResponse LedgerService::Authorize(const AuthorizeRequest& req) {
  return ObserveRpc("LedgerService.Authorize", [&] {
    auto decision = ctx_.access->Authorize(req.token(), req.user_id());

    AuthorizeResponse resp;
    resp.set_outcome(ToOutcome(decision.error));
    resp.set_charged(decision.charged);
    resp.set_play_only(decision.play_only);
    resp.set_balance(decision.balance);
    if (decision.error != util::ErrorKind::kNotFound) {
      *resp.mutable_reference() = std::move(decision.reference);
    }
    return resp;
  });
}

BalanceResponse LedgerService::Refund(const UserRequest& req) {
  return ObserveRpc("LedgerService.Refund", [&] {
    BalanceResponse resp;
    resp.set_balance(ctx_.access->Refund(req.user_id()));
    return resp;
  });
}

PremiumUser LedgerService::AddPremiumUser(const AddPremiumUserRequest& req) {
  return ObserveRpc("LedgerService.AddPremiumUser", [&] {
    std::optional<uint32_t> period_days;
    if (req.has_period_days()) period_days = req.period_days();
    return ctx_.store->AddPremiumUser(req.user_id(), period_days);
  });
}

RemovePremiumUserResponse LedgerService::RemovePremiumUser(const UserRequest& req) {
  return ObserveRpc("LedgerService.RemovePremiumUser", [&] {
    RemovePremiumUserResponse resp;
    resp.set_removed(ctx_.store->RemovePremiumUser(req.user_id()));
    return resp;
  });
}

ListPremiumUsersResponse LedgerService::ListPremiumUsers(const ListPremiumUsersRequest&) {
  return ObserveRpc("LedgerService.ListPremiumUsers", [&] {
    ListPremiumUsersResponse resp;
    for (auto& user : ctx_.store->ListPremiumUsers()) {
      *resp.add_users() = std::move(user);
    }
    return resp;
  });
}

} // namespace streamgate::service
