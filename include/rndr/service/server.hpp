#pragma once

#include <rndr/service/v1/ledger.grpc.pb.h>
#include <rndr/execution/engine.hpp>

namespace rndr::service {

/// Callback listener exposing the execution engine over gRPC.
///
/// Quick reference:
/// - Info: committed height, state root and chain id.
/// - CheckTx: mempool admission checks; no state mutation.
/// - FinalizeBlock: execute block and return tx results + state root.
/// - Commit: persist finalized state.
/// - Query: read committed state by route.
struct listener final : public rndr::service::v1::Ledger::CallbackService {
  /// Bind listener to execution engine instance.
  explicit listener(rndr::execution::engine& engine);

  /// Return app metadata used during node/app handshake.
  virtual grpc::ServerUnaryReactor* Info(
      grpc::CallbackServerContext* context,
      const rndr::service::v1::InfoRequest* request,
      rndr::service::v1::InfoResponse* response) override final;

  /// Mempool admission check for a single tx (decode/validate only).
  virtual grpc::ServerUnaryReactor* CheckTx(
      grpc::CallbackServerContext* context,
      const rndr::service::v1::CheckTxRequest* request,
      rndr::service::v1::CheckTxResponse* response) override final;

  /// Execute ordered block transactions and return tx results + state root.
  virtual grpc::ServerUnaryReactor* FinalizeBlock(
      grpc::CallbackServerContext* context,
      const rndr::service::v1::FinalizeBlockRequest* request,
      rndr::service::v1::FinalizeBlockResponse* response) override final;

  /// Persist finalized state after FinalizeBlock.
  virtual grpc::ServerUnaryReactor* Commit(
      grpc::CallbackServerContext* context,
      const rndr::service::v1::CommitRequest* request,
      rndr::service::v1::CommitResponse* response) override final;

  /// Execute deterministic read query against current committed state.
  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const rndr::service::v1::QueryRequest* request,
      rndr::service::v1::QueryResponse* response) override final;

  rndr::execution::engine& execution_engine_;
};

}  // namespace rndr::service
