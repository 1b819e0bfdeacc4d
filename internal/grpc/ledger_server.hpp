#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/ledger_service.hpp"
#include "streamgate/v1/ledger_service.grpc.pb.h"

namespace streamgate::grpc {

class LedgerServer final : public streamgate::v1::LedgerService::Service {
 public:
  explicit LedgerServer(std::shared_ptr<streamgate::service::LedgerService> svc);

  ::grpc::Status GetCredits(::grpc::ServerContext*, const streamgate::v1::UserRequest*, streamgate::v1::BalanceResponse*) override;
  ::grpc::Status AddCredits(::grpc::ServerContext*, const streamgate::v1::AmountRequest*, streamgate::v1::BalanceResponse*) override;
  ::grpc::Status ChargeCredits(::grpc::ServerContext*, const streamgate::v1::AmountRequest*, streamgate::v1::ChargeResponse*) override;
  ::grpc::Status ListBalances(::grpc::ServerContext*, const streamgate::v1::ListBalancesRequest*, streamgate::v1::ListBalancesResponse*) override;
  ::grpc::Status GetPayPlan(::grpc::ServerContext*, const streamgate::v1::GetPayPlanRequest*, streamgate::v1::PayPlan*) override;
  ::grpc::Status SetPayPlan(::grpc::ServerContext*, const streamgate::v1::PayPlan*, streamgate::v1::PayPlan*) override;
  ::grpc::Status GetPayee(::grpc::ServerContext*, const streamgate::v1::GetPayeeRequest*, streamgate::v1::Payee*) override;
  ::grpc::Status SetPayee(::grpc::ServerContext*, const streamgate::v1::Payee*, streamgate::v1::Payee*) override;
  ::grpc::Status CreatePaymentRequest(::grpc::ServerContext*, const streamgate::v1::CreatePaymentRequestRequest*, streamgate::v1::PaymentResponse*) override;
  ::grpc::Status SubmitPayment(::grpc::ServerContext*, const streamgate::v1::SubmitPaymentRequest*, streamgate::v1::PaymentResponse*) override;
  ::grpc::Status SetPaymentStatus(::grpc::ServerContext*, const streamgate::v1::SetPaymentStatusRequest*, streamgate::v1::PaymentResponse*) override;
  ::grpc::Status GetPaymentRequest(::grpc::ServerContext*, const streamgate::v1::GetPaymentRequestRequest*, streamgate::v1::PaymentResponse*) override;
  ::grpc::Status ListPaymentRequests(::grpc::ServerContext*, const streamgate::v1::ListPaymentRequestsRequest*, streamgate::v1::ListPaymentRequestsResponse*) override;
  ::grpc::Status SetPendingSubmission(::grpc::ServerContext*, const streamgate::v1::SetPendingSubmissionRequest*, streamgate::v1::PaymentResponse*) override;
  ::grpc::Status GetPendingSubmission(::grpc::ServerContext*, const streamgate::v1::UserRequest*, streamgate::v1::PendingSubmissionResponse*) override;
  ::grpc::Status Authorize(::grpc::ServerContext*, const streamgate::v1::AuthorizeRequest*, streamgate::v1::AuthorizeResponse*) override;
  ::grpc::Status Refund(::grpc::ServerContext*, const streamgate::v1::UserRequest*, streamgate::v1::BalanceResponse*) override;
  ::grpc::Status AddPremiumUser(::grpc::ServerContext*, const streamgate::v1::AddPremiumUserRequest*, streamgate::v1::PremiumUser*) override;
  ::grpc::Status RemovePremiumUser(::grpc::ServerContext*, const streamgate::v1::UserRequest*, streamgate::v1::RemovePremiumUserResponse*) override;
  ::grpc::Status ListPremiumUsers(::grpc::ServerContext*, const streamgate::v1::ListPremiumUsersRequest*, streamgate::v1::ListPremiumUsersResponse*) override;

 private:
  std::shared_ptr<streamgate::service::LedgerService> service_;
};

} // namespace streamgate::grpc
