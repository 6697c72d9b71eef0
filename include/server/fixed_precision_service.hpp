#pragma once
#include <grpcpp/grpcpp.h>
#include "fixed_precision.grpc.pb.h"
#include <memory>
#include <string>

namespace fp = fixed_precision::v1;

class FixedPrecisionServiceImpl final : public fp::FixedPrecision::Service {
public:
  explicit FixedPrecisionServiceImpl(std::string db_path);
  ~FixedPrecisionServiceImpl() override;                       // needed for pimpl

  FixedPrecisionServiceImpl(const FixedPrecisionServiceImpl&)            = delete;
  FixedPrecisionServiceImpl& operator=(const FixedPrecisionServiceImpl&) = delete;

  grpc::Status ToFixed(grpc::ServerContext*,
                       const fp::ToFixedRequest*,
                       fp::ToFixedResponse*) override;

  grpc::Status ToFloat(grpc::ServerContext*,
                       const fp::ToFloatRequest*,
                       fp::ToFloatResponse*) override;

  grpc::Status RegisterInstrument(grpc::ServerContext*,
                                  const fp::RegisterInstrumentRequest*,
                                  fp::RegisterInstrumentResponse*) override;

  grpc::Status GetInstrument(grpc::ServerContext*,
                             const fp::GetInstrumentRequest*,
                             fp::GetInstrumentResponse*) override;

  grpc::Status MakePrice(grpc::ServerContext*,
                         const fp::MakeValueRequest*,
                         fp::MakePriceResponse*) override;

  grpc::Status MakeQuantity(grpc::ServerContext*,
                            const fp::MakeValueRequest*,
                            fp::MakeQuantityResponse*) override;

private:
  struct Impl;                    // forward-declared implementation
  std::unique_ptr<Impl> d_;       // pimpl
};
