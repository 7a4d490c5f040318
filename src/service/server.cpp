#include <spdlog/spdlog.h>
#include <rndr/service/server.hpp>
#include <string>
#include <vector>

using namespace rndr::service;
using namespace rndr::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

grpc::ServerUnaryReactor* finish_invalid(grpc::CallbackServerContext* context,
                                         const std::string& message) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message});
  return reactor;
}

void populate_tx_result(const transaction_result_t& source,
                        rndr::service::v1::TxResult* destination) {
  destination->set_code(source.code);
  destination->set_data(make_string(source.data));
  destination->set_log(source.log);
  destination->set_info(source.info);
  destination->set_gas_wanted(source.gas_wanted);
  destination->set_gas_used(source.gas_used);
  destination->set_codespace(source.codespace);
  for (const auto& event : source.events) {
    auto* out = destination->add_events();
    out->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* pair = out->add_attributes();
      pair->set_key(attribute.key);
      pair->set_value(attribute.value);
      pair->set_index(attribute.index);
    }
  }
}

}  // namespace

listener::listener(rndr::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Info(
    grpc::CallbackServerContext* context,
    const rndr::service::v1::InfoRequest* /*request*/,
    rndr::service::v1::InfoResponse* response) {
  auto info = execution_engine_.info();
  const auto& chain_id = execution_engine_.chain_id();
  response->set_data(info.data);
  response->set_version(info.version);
  response->set_app_version(info.app_version);
  response->set_last_block_height(info.last_block_height);
  response->set_last_block_state_root(make_string(
      bytes_view_t{info.last_block_state_root.data(),
                   info.last_block_state_root.size()}));
  response->set_chain_id(
      make_string(bytes_view_t{chain_id.data(), chain_id.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::CheckTx(
    grpc::CallbackServerContext* context,
    const rndr::service::v1::CheckTxRequest* request,
    rndr::service::v1::CheckTxResponse* response) {
  auto tx = make_bytes(request->tx());
  auto check =
      execution_engine_.check_transaction(bytes_view_t{tx.data(), tx.size()});
  response->set_code(check.code);
  response->set_data(make_string(check.data));
  response->set_log(check.log);
  response->set_info(check.info);
  response->set_gas_wanted(check.gas_wanted);
  response->set_gas_used(check.gas_used);
  response->set_codespace(check.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::FinalizeBlock(
    grpc::CallbackServerContext* context,
    const rndr::service::v1::FinalizeBlockRequest* request,
    rndr::service::v1::FinalizeBlockResponse* response) {
  if (request->height() <= 0) {
    spdlog::warn("Rejecting FinalizeBlock with height {}", request->height());
    return finish_invalid(context, "height must be positive");
  }
  auto txs = std::vector<bytes_t>{};
  txs.reserve(static_cast<size_t>(request->txs_size()));
  for (const auto& tx : request->txs()) {
    txs.push_back(make_bytes(tx));
  }

  auto execution = execution_engine_.finalize_block(
      static_cast<uint64_t>(request->height()), txs);
  for (const auto& tx_result : execution.tx_results) {
    populate_tx_result(tx_result, response->add_tx_results());
  }
  response->set_state_root(make_string(
      bytes_view_t{execution.state_root.data(), execution.state_root.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Commit(
    grpc::CallbackServerContext* context,
    const rndr::service::v1::CommitRequest* /*request*/,
    rndr::service::v1::CommitResponse* response) {
  auto committed = execution_engine_.commit();
  response->set_retain_height(committed.retain_height);
  response->set_committed_height(committed.committed_height);
  response->set_state_root(make_string(
      bytes_view_t{committed.state_root.data(), committed.state_root.size()}));
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const rndr::service::v1::QueryRequest* request,
    rndr::service::v1::QueryResponse* response) {
  auto data = make_bytes(request->data());
  auto query = execution_engine_.query(request->path(),
                                       bytes_view_t{data.data(), data.size()});
  response->set_code(query.code);
  response->set_log(query.log);
  response->set_info(query.info);
  response->set_key(make_string(query.key));
  response->set_value(make_string(query.value));
  response->set_height(query.height);
  response->set_codespace(query.codespace);
  return finish_ok(context);
}
