#include <grpcpp/grpcpp.h>
#include "fixed_precision.grpc.pb.h"
#include "fixed_precision.pb.h"
#include <iostream>
#include <memory>
#include <string>

namespace fp = fixed_precision::v1;

static void usage(const char* prog) {
    std::cerr <<
      "Usage:\n"
      "  " << prog << " <addr> to-fixed <value> <precision>\n"
      "  " << prog << " <addr> to-float <raw> <precision>\n"
      "  " << prog << " <addr> register <symbol> <price_precision> <size_precision>\n"
      "  " << prog << " <addr> price <symbol> <decimal>\n"
      "  " << prog << " <addr> quantity <symbol> <decimal>\n"
      "  Example:\n"
      "  " << prog << " localhost:50051 to-fixed 1.25 1\n"
      "  " << prog << " localhost:50051 register ethusdt 2 4\n"
      "  " << prog << " localhost:50051 price ETHUSDT 2450.125\n";
}

static int report_failure(const grpc::Status& status) {
    std::cerr << "[client] RPC failed: " << status.error_code() << " - " << status.error_message() << "\n";
    return 2;
}

int main(int argc, char** argv) {
    if (argc < 4) { usage(argv[0]); return 1; }

    std::string addr = argv[1];
    std::string cmd  = argv[2];

    // InsecureChannelCredentials() is fine for local dev. For anything else, switch to TLS
    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
    std::unique_ptr<fp::FixedPrecision::Stub> stub = fp::FixedPrecision::NewStub(channel);

    try {
        if (cmd == "to-fixed" && argc == 5) {
            fp::ToFixedRequest req;
            req.set_value(std::stod(argv[3]));
            req.set_precision(static_cast<uint32_t>(std::stoul(argv[4])));

            grpc::ClientContext ctx;
            fp::ToFixedResponse resp;
            grpc::Status status = stub->ToFixed(&ctx, req, &resp);
            if (!status.ok()) return report_failure(status);
            std::cout << resp.raw() << "\n";
            return 0;
        }

        if (cmd == "to-float" && argc == 5) {
            fp::ToFloatRequest req;
            req.set_raw(std::stoll(argv[3]));
            req.set_precision(static_cast<uint32_t>(std::stoul(argv[4])));

            grpc::ClientContext ctx;
            fp::ToFloatResponse resp;
            grpc::Status status = stub->ToFloat(&ctx, req, &resp);
            if (!status.ok()) return report_failure(status);
            std::cout.precision(17);
            std::cout << resp.value() << "\n";
            return 0;
        }

        if (cmd == "register" && argc == 6) {
            fp::RegisterInstrumentRequest req;
            auto* inst = req.mutable_instrument();
            inst->set_symbol(argv[3]);
            inst->set_price_precision(static_cast<uint32_t>(std::stoul(argv[4])));
            inst->set_size_precision(static_cast<uint32_t>(std::stoul(argv[5])));

            grpc::ClientContext ctx;
            fp::RegisterInstrumentResponse resp;
            grpc::Status status = stub->RegisterInstrument(&ctx, req, &resp);
            if (!status.ok()) return report_failure(status);
            if (!resp.success()) {
                std::cerr << "[client] rejected: " << resp.error_message() << "\n";
                return 3;
            }
            std::cout << "[client] registered " << argv[3] << "\n";
            return 0;
        }

        if ((cmd == "price" || cmd == "quantity") && argc == 5) {
            fp::MakeValueRequest req;
            req.set_symbol(argv[3]);
            req.set_text(argv[4]);   // decimal text keeps every digit the user typed

            grpc::ClientContext ctx;
            grpc::Status status;
            if (cmd == "price") {
                fp::MakePriceResponse resp;
                status = stub->MakePrice(&ctx, req, &resp);
                if (!status.ok()) return report_failure(status);
                std::cout << resp.text() << " raw=" << resp.raw() << " precision=" << resp.precision() << "\n";
            } else {
                fp::MakeQuantityResponse resp;
                status = stub->MakeQuantity(&ctx, req, &resp);
                if (!status.ok()) return report_failure(status);
                std::cout << resp.text() << " raw=" << resp.raw() << " precision=" << resp.precision() << "\n";
            }
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "[client] bad numeric argument: " << e.what() << "\n";
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "[client] numeric argument out of range: " << e.what() << "\n";
        return 1;
    }

    usage(argv[0]);
    return 1;
}
