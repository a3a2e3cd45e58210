#include "relay_error.hpp"

#include <string>

namespace conduit::asio {

namespace {

class relay_error_category : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "conduit.relay";
    }

    std::string message(int value) const override {
        switch (static_cast<relay_errc>(value)) {
            case relay_errc::short_write:
                return "short write";
            case relay_errc::invalid_write_result:
                return "invalid write result";
            case relay_errc::idle_timeout:
                return "relay idle timeout";
            case relay_errc::cancelled:
                return "relay cancelled";
            case relay_errc::stream_failure:
                return "stream failure";
        }
        return "unknown relay error";
    }
};

}

const boost::system::error_category& relay_category() noexcept {
    static const relay_error_category category;
    return category;
}

boost::system::error_code make_error_code(relay_errc code) noexcept {
    return {static_cast<int>(code), relay_category()};
}

}
