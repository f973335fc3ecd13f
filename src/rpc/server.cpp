#include <clearhouse/rpc/mapping.hpp>
#include <clearhouse/rpc/server.hpp>

#include <spdlog/spdlog.h>

#include <chrono>

using namespace clearhouse::rpc;
using namespace clearhouse::schema;

namespace {

grpc::ServerUnaryReactor* finish(grpc::CallbackServerContext* context,
                                 const grpc::Status& status) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(status);
  return reactor;
}

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  return finish(context, grpc::Status::OK);
}

}  // namespace

namespace clearhouse::rpc {

timestamp_milliseconds_t system_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

listener::listener(clearhouse::execution::engine& engine,
                   clearhouse::ledger::emitter& emitter,
                   clock_function_t clock)
    : engine_{engine}, emitter_{emitter}, clock_{std::move(clock)} {}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const clearhouse::v1::SubmitRequest* request,
    clearhouse::v1::SubmitResponse* response) {
  auto result = engine_.submit(to_submission(*request), clock_());
  to_proto(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetBatch(
    grpc::CallbackServerContext* context,
    const clearhouse::v1::GetBatchRequest* request,
    clearhouse::v1::Batch* response) {
  auto batch = engine_.batch(request->batch_id());
  if (!batch) {
    return finish(context, grpc::Status{grpc::StatusCode::NOT_FOUND,
                                        "unknown batch " + request->batch_id()});
  }
  to_proto(*batch, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::GetTransaction(
    grpc::CallbackServerContext* context,
    const clearhouse::v1::GetTransactionRequest* request,
    clearhouse::v1::TransactionStatus* response) {
  auto status = engine_.transaction_status(request->transaction_id());
  if (!status) {
    return finish(context,
                  grpc::Status{grpc::StatusCode::NOT_FOUND,
                               "unknown transaction " + request->transaction_id()});
  }
  to_proto(*status, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Health(
    grpc::CallbackServerContext* context,
    const clearhouse::v1::HealthRequest* /*request*/,
    clearhouse::v1::HealthResponse* response) {
  response->set_serving(true);
  response->set_pending_intents(engine_.pending());
  response->set_parked_events(emitter_.pending());
  return finish_ok(context);
}

}  // namespace clearhouse::rpc
