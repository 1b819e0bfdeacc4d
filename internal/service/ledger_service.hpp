#pragma once

#include "service_context.hpp"
#include "streamgate/v1/ledger_service.pb.h"

namespace streamgate::service {

class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  streamgate::v1::BalanceResponse      GetCredits(const streamgate::v1::UserRequest& req);
  streamgate::v1::BalanceResponse      AddCredits(const streamgate::v1::AmountRequest& req);
  streamgate::v1::ChargeResponse       ChargeCredits(const streamgate::v1::AmountRequest& req);
  streamgate::v1::ListBalancesResponse ListBalances(const streamgate::v1::ListBalancesRequest& req);

  streamgate::v1::PayPlan GetPayPlan(const streamgate::v1::GetPayPlanRequest& req);
  streamgate::v1::PayPlan SetPayPlan(const streamgate::v1::PayPlan& req);
  streamgate::v1::Payee   GetPayee(const streamgate::v1::GetPayeeRequest& req);
  streamgate::v1::Payee   SetPayee(const streamgate::v1::Payee& req);

  streamgate::v1::PaymentResponse             CreatePaymentRequest(const streamgate::v1::CreatePaymentRequestRequest& req);
  streamgate::v1::PaymentResponse             SubmitPayment(const streamgate::v1::SubmitPaymentRequest& req);
  streamgate::v1::PaymentResponse             SetPaymentStatus(const streamgate::v1::SetPaymentStatusRequest& req);
  streamgate::v1::PaymentResponse             GetPaymentRequest(const streamgate::v1::GetPaymentRequestRequest& req);
  streamgate::v1::ListPaymentRequestsResponse ListPaymentRequests(const streamgate::v1::ListPaymentRequestsRequest& req);
  streamgate::v1::PaymentResponse             SetPendingSubmission(const streamgate::v1::SetPendingSubmissionRequest& req);
  streamgate::v1::PendingSubmissionResponse   GetPendingSubmission(const streamgate::v1::UserRequest& req);

  streamgate::v1::AuthorizeResponse Authorize(const streamgate::v1::AuthorizeRequest& req);
  streamgate::v1::BalanceResponse   Refund(const streamgate::v1::UserRequest& req);

  streamgate::v1::PremiumUser               AddPremiumUser(const streamgate::v1::AddPremiumUserRequest& req);
  streamgate::v1::RemovePremiumUserResponse RemovePremiumUser(const streamgate::v1::UserRequest& req);
  streamgate::v1::ListPremiumUsersResponse  ListPremiumUsers(const streamgate::v1::ListPremiumUsersRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace streamgate::service
