#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace streamgate::grpc {

using namespace streamgate::v1;

LedgerServer::LedgerServer(std::shared_ptr<streamgate::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::GetCredits(::grpc::ServerContext*, const UserRequest* req, BalanceResponse* resp) {
  try {
    *resp = service_->GetCredits(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::AddCredits(::grpc::ServerContext*, const AmountRequest* req, BalanceResponse* resp) {
  try {
    *resp = service_->AddCredits(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ChargeCredits(::grpc::ServerContext*, const AmountRequest* req, ChargeResponse* resp) {
  try {
    *resp = service_->ChargeCredits(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListBalances(::grpc::ServerContext*, const ListBalancesRequest* req, ListBalancesResponse* resp) {
  try {
    *resp = service_->ListBalances(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetPayPlan(::grpc::ServerContext*, const GetPayPlanRequest* req, PayPlan* resp) {
  try {
    *resp = service_->GetPayPlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SetPayPlan(::grpc::ServerContext*, const PayPlan* req, PayPlan* resp) {
  try {
    *resp = service_->SetPayPlan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetPayee(::grpc::ServerContext*, const GetPayeeRequest* req, Payee* resp) {
  try {
    *resp = service_->GetPayee(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SetPayee(::grpc::ServerContext*, const Payee* req, Payee* resp) {
  try {
    *resp = service_->SetPayee(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::CreatePaymentRequest(::grpc::ServerContext*, const CreatePaymentRequestRequest* req, PaymentResponse* resp) {
  try {
    *resp = service_->CreatePaymentRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SubmitPayment(::grpc::ServerContext*, const SubmitPaymentRequest* req, PaymentResponse* resp) {
  try {
    *resp = service_->SubmitPayment(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SetPaymentStatus(::grpc::ServerContext*, const SetPaymentStatusRequest* req, PaymentResponse* resp) {
  try {
    *resp = service_->SetPaymentStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetPaymentRequest(::grpc::ServerContext*, const GetPaymentRequestRequest* req, PaymentResponse* resp) {
  try {
    *resp = service_->GetPaymentRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListPaymentRequests(::grpc::ServerContext*, const ListPaymentRequestsRequest* req, ListPaymentRequestsResponse* resp) {
  try {
    *resp = service_->ListPaymentRequests(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::SetPendingSubmission(::grpc::ServerContext*, const SetPendingSubmissionRequest* req, PaymentResponse* resp) {
  try {
    *resp = service_->SetPendingSubmission(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetPendingSubmission(::grpc::ServerContext*, const UserRequest* req, PendingSubmissionResponse* resp) {
  try {
    *resp = service_->GetPendingSubmission(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Authorize(::grpc::ServerContext*, const AuthorizeRequest* req, AuthorizeResponse* resp) {
  try {
    *resp = service_->Authorize(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::Refund(::grpc::ServerContext*, const UserRequest* req, BalanceResponse* resp) {
  try {
    *resp = service_->Refund(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::AddPremiumUser(::grpc::ServerContext*, const AddPremiumUserRequest* req, PremiumUser* resp) {
  try {
    *resp = service_->AddPremiumUser(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::RemovePremiumUser(::grpc::ServerContext*, const UserRequest* req, RemovePremiumUserResponse* resp) {
  try {
    *resp = service_->RemovePremiumUser(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::ListPremiumUsers(::grpc::ServerContext*, const ListPremiumUsersRequest* req, ListPremiumUsersResponse* resp) {
  try {
    *resp = service_->ListPremiumUsers(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace streamgate::grpc
