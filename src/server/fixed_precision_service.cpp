#include "server/fixed_precision_service.hpp"

#include "domain/fixed.hpp"
#include "domain/instrument.hpp"
#include "domain/price.hpp"
#include "domain/quantity.hpp"
#include "storage/storage.hpp"
#include "utils/logging.hpp"
#include "utils/strings.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace {

// Maps conversion errors onto gRPC status codes and logs the outcome.
template <typename Fn>
grpc::Status guarded(const char* rpc, Fn&& fn) {
  const auto t0 = std::chrono::steady_clock::now();
  grpc::Status status = grpc::Status::OK;

  try {
    status = fn();
  } catch (const InvalidPrecision& e) {
    log_stream(LogLevel::Warning) << "[SERVER] [" << rpc << "][reject] reason=invalid_precision " << e.what() << "\n";
    status = grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const InvalidInput& e) {
    log_stream(LogLevel::Warning) << "[SERVER] [" << rpc << "][reject] reason=invalid_input " << e.what() << "\n";
    status = grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const NumericOverflow& e) {
    log_stream(LogLevel::Warning) << "[SERVER] [" << rpc << "][reject] reason=numeric_overflow " << e.what() << "\n";
    status = grpc::Status(grpc::StatusCode::OUT_OF_RANGE, e.what());
  }

  const auto dur_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - t0).count();
  log_stream(LogLevel::Debug) << "[SERVER] [" << rpc << "] status=" << status.error_code()
            << " done in " << dur_us << "us\n";
  return status;
}

grpc::Status unknown_symbol(const char* rpc, const std::string& symbol) {
  log_stream(LogLevel::Warning) << "[SERVER] [" << rpc << "][reject] reason=unknown_symbol symbol=" << symbol << "\n";
  return grpc::Status(grpc::StatusCode::NOT_FOUND, "unknown symbol " + symbol);
}

}  // namespace

// ============================= Impl =============================
struct FixedPrecisionServiceImpl::Impl {
  explicit Impl(std::string db_path) : storage(std::move(db_path)) {
    storage.init();
  }

  Storage storage;                 // long-lived DB handle
  std::mutex write_mu;             // serialize DB writes
};

// ========================== API surface =========================
FixedPrecisionServiceImpl::FixedPrecisionServiceImpl(std::string db_path)
  : d_(std::make_unique<Impl>(std::move(db_path))) {}

FixedPrecisionServiceImpl::~FixedPrecisionServiceImpl() = default;

// RPC: ToFixed(value, precision) -> raw
grpc::Status FixedPrecisionServiceImpl::ToFixed(
    grpc::ServerContext*,
    const fp::ToFixedRequest* req,
    fp::ToFixedResponse* resp) {

  log_stream(LogLevel::Info) << "[SERVER] [ToFixed] value=" << req->value()
            << " precision=" << req->precision() << "\n";

  return guarded("ToFixed", [&] {
    check_precision(req->precision());  // before narrowing to uint8
    resp->set_raw(to_fixed(req->value(), static_cast<uint8_t>(req->precision())));
    return grpc::Status::OK;
  });
}

// RPC: ToFloat(raw, precision) -> value
grpc::Status FixedPrecisionServiceImpl::ToFloat(
    grpc::ServerContext*,
    const fp::ToFloatRequest* req,
    fp::ToFloatResponse* resp) {

  log_stream(LogLevel::Info) << "[SERVER] [ToFloat] raw=" << req->raw()
            << " precision=" << req->precision() << "\n";

  return guarded("ToFloat", [&] {
    check_precision(req->precision());
    resp->set_value(to_float(req->raw(), static_cast<uint8_t>(req->precision())));
    return grpc::Status::OK;
  });
}

grpc::Status FixedPrecisionServiceImpl::RegisterInstrument(
    grpc::ServerContext*,
    const fp::RegisterInstrumentRequest* req,
    fp::RegisterInstrumentResponse* resp) {

  const auto& in = req->instrument();
  log_stream(LogLevel::Info) << "[SERVER] [RegisterInstrument] symbol=" << in.symbol()
            << " price_precision=" << in.price_precision()
            << " size_precision=" << in.size_precision() << "\n";

  return guarded("RegisterInstrument", [&] {
    const Instrument inst = Instrument::Make(in.symbol(), in.price_precision(), in.size_precision());

    bool ok = false;
    {
      std::lock_guard<std::mutex> lk(d_->write_mu); // serialize writes to SQLite
      ok = d_->storage.upsert_instrument(inst);
    }

    resp->set_success(ok);
    if (!ok) {
      resp->set_error_message("DB upsert failed");
      log_stream(LogLevel::Error) << "[SERVER] [RegisterInstrument][error] symbol=" << inst.symbol << " outcome=db_upsert_failed\n";
    } else {
      log_stream(LogLevel::Info) << "[SERVER] [RegisterInstrument][ok] symbol=" << inst.symbol << "\n";
    }
    return grpc::Status::OK;
  });
}

grpc::Status FixedPrecisionServiceImpl::GetInstrument(
    grpc::ServerContext*,
    const fp::GetInstrumentRequest* req,
    fp::GetInstrumentResponse* resp) {

  log_stream(LogLevel::Info) << "[SERVER] [GetInstrument] symbol=" << req->symbol() << "\n";

  return guarded("GetInstrument", [&] {
    const std::optional<Instrument> inst = d_->storage.find_instrument(req->symbol());
    resp->set_found(inst.has_value());
    if (inst) {
      auto* out = resp->mutable_instrument();
      out->set_symbol(inst->symbol);
      out->set_price_precision(inst->price_precision);
      out->set_size_precision(inst->size_precision);
    }
    return grpc::Status::OK;
  });
}

grpc::Status FixedPrecisionServiceImpl::MakePrice(
    grpc::ServerContext*,
    const fp::MakeValueRequest* req,
    fp::MakePriceResponse* resp) {

  log_stream(LogLevel::Info) << "[SERVER] [MakePrice] symbol=" << req->symbol()
            << (req->has_text() ? " text=" + req->text() : " value=" + std::to_string(req->value()))
            << "\n";

  return guarded("MakePrice", [&] {
    const std::optional<Instrument> inst = d_->storage.find_instrument(req->symbol());
    if (!inst) return unknown_symbol("MakePrice", normalize_symbol(req->symbol()));

    if (req->input_case() == fp::MakeValueRequest::INPUT_NOT_SET) {
      throw InvalidInput("either value or text is required");
    }
    const Price px = req->has_text() ? inst->parse_price(req->text()) : inst->make_price(req->value());

    resp->set_raw(px.raw());
    resp->set_precision(px.precision());
    resp->set_text(px.to_string());
    resp->set_value(px.as_double());
    return grpc::Status::OK;
  });
}

grpc::Status FixedPrecisionServiceImpl::MakeQuantity(
    grpc::ServerContext*,
    const fp::MakeValueRequest* req,
    fp::MakeQuantityResponse* resp) {

  log_stream(LogLevel::Info) << "[SERVER] [MakeQuantity] symbol=" << req->symbol()
            << (req->has_text() ? " text=" + req->text() : " value=" + std::to_string(req->value()))
            << "\n";

  return guarded("MakeQuantity", [&] {
    const std::optional<Instrument> inst = d_->storage.find_instrument(req->symbol());
    if (!inst) return unknown_symbol("MakeQuantity", normalize_symbol(req->symbol()));

    if (req->input_case() == fp::MakeValueRequest::INPUT_NOT_SET) {
      throw InvalidInput("either value or text is required");
    }
    const Quantity qty = req->has_text() ? inst->parse_qty(req->text()) : inst->make_qty(req->value());

    resp->set_raw(qty.raw());
    resp->set_precision(qty.precision());
    resp->set_text(qty.to_string());
    resp->set_value(qty.as_double());
    return grpc::Status::OK;
  });
}
