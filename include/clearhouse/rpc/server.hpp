#pragma once

#include <clearhouse/v1/settlement.grpc.pb.h>
#include <clearhouse/execution/engine.hpp>
#include <clearhouse/ledger/emitter.hpp>
#include <clearhouse/schema/primitives.hpp>

#include <functional>

namespace clearhouse::rpc {

using clock_function_t =
    std::function<clearhouse::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the epoch.
clearhouse::schema::timestamp_milliseconds_t system_now();

/// Callback-style gRPC front end of the settlement engine.
struct listener final : public clearhouse::v1::Settlement::CallbackService {
  listener(clearhouse::execution::engine& engine,
           clearhouse::ledger::emitter& emitter,
           clock_function_t clock = system_now);

  /// Validate and admit a submission; duplicates return the first outcome.
  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const clearhouse::v1::SubmitRequest* request,
      clearhouse::v1::SubmitResponse* response) override final;

  /// Finalized batch by id; NOT_FOUND when unknown.
  virtual grpc::ServerUnaryReactor* GetBatch(
      grpc::CallbackServerContext* context,
      const clearhouse::v1::GetBatchRequest* request,
      clearhouse::v1::Batch* response) override final;

  virtual grpc::ServerUnaryReactor* GetTransaction(
      grpc::CallbackServerContext* context,
      const clearhouse::v1::GetTransactionRequest* request,
      clearhouse::v1::TransactionStatus* response) override final;

  virtual grpc::ServerUnaryReactor* Health(
      grpc::CallbackServerContext* context,
      const clearhouse::v1::HealthRequest* request,
      clearhouse::v1::HealthResponse* response) override final;

 private:
  clearhouse::execution::engine& engine_;
  clearhouse::ledger::emitter& emitter_;
  clock_function_t clock_;
};

}  // namespace clearhouse::rpc
