#include "common/errors.hpp"

namespace ember {

namespace {

class EmberErrorCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override {
        return "ember";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::wrong_type:
                return "WRONGTYPE Operation against a key holding the wrong kind of value";
            case Errc::not_an_integer:
                return "ERR value is not an integer or out of range";
            case Errc::increment_overflow:
                return "ERR increment or decrement would overflow";
            case Errc::invalid_stream_id:
                return "ERR Invalid stream ID specified as stream command argument";
            case Errc::stream_id_zero:
                return "ERR The ID specified in XADD must be greater than 0-0";
            case Errc::stream_id_not_increasing:
                return "ERR The ID specified in XADD is equal or smaller than the target stream top item";
            case Errc::nested_multi:
                return "ERR MULTI calls can not be nested";
            case Errc::exec_without_multi:
                return "ERR EXEC without MULTI";
            case Errc::discard_without_multi:
                return "ERR DISCARD without MULTI";
            case Errc::exec_aborted:
                return "EXECABORT Transaction discarded because of previous errors.";
            case Errc::syntax_error:
                return "ERR syntax error";
            case Errc::invalid_expire:
                return "ERR invalid expire time in 'set' command";
            case Errc::value_out_of_range:
                return "ERR value is out of range, must be positive";
            case Errc::negative_timeout:
                return "ERR timeout is negative";
            case Errc::invalid_timeout:
                return "ERR timeout is not a float or out of range";
            case Errc::unbalanced_xread:
                return "ERR Unbalanced 'xread' list of streams: for each stream key an ID or '$' must be specified.";
        }
        return "ERR unknown error";
    }
};

} // anonymous namespace

const std::error_category& error_category() noexcept {
    static const EmberErrorCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

} // namespace ember
