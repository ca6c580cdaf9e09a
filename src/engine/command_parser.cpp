#include "engine/command.hpp"

#include "common/errors.hpp"
#include "engine/command_table.hpp"
#include "storage/stream_id.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>

namespace ember::engine {

namespace {

ErrorReply error(Errc e) {
    return ErrorReply{make_error_code(e).message()};
}

bool parse_i64(std::string_view sv, int64_t& out) {
    if (sv.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// BLPOP timeout: seconds, fractional allowed.
std::optional<ErrorReply> parse_seconds(std::string_view sv,
                                        std::optional<std::chrono::milliseconds>& out) {
    double secs = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), secs);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size() ||
        !std::isfinite(secs)) {
        return error(Errc::invalid_timeout);
    }
    if (secs < 0) {
        return error(Errc::negative_timeout);
    }
    constexpr double kMaxSeconds =
        static_cast<double>(std::numeric_limits<int64_t>::max() / 1000 / 1000);
    if (secs > kMaxSeconds) {
        return error(Errc::invalid_timeout);
    }
    const auto ms = static_cast<int64_t>(std::ceil(secs * 1000.0));
    if (ms == 0) {
        out.reset();
    } else {
        out = std::chrono::milliseconds{ms};
    }
    return std::nullopt;
}

ParseResult parse_set(const Request& r) {
    SetCmd cmd{r[1], r[2], std::nullopt};
    for (std::size_t i = 3; i < r.size(); ++i) {
        const std::string opt = to_lower(r[i]);
        if ((opt != "ex" && opt != "px") || cmd.ttl || i + 1 >= r.size()) {
            return error(Errc::syntax_error);
        }
        int64_t n = 0;
        if (!parse_i64(r[i + 1], n)) {
            return error(Errc::not_an_integer);
        }
        if (n <= 0) {
            return error(Errc::invalid_expire);
        }
        if (opt == "ex") {
            if (n > std::numeric_limits<int64_t>::max() / 1000) {
                return error(Errc::invalid_expire);
            }
            n *= 1000;
        }
        cmd.ttl = std::chrono::milliseconds{n};
        ++i;
    }
    return Command{std::move(cmd)};
}

ParseResult parse_lpop(const Request& r) {
    if (r.size() > 3) {
        return ErrorReply{wrong_arity_message("lpop")};
    }
    LpopCmd cmd{r[1], std::nullopt};
    if (r.size() == 3) {
        int64_t n = 0;
        if (!parse_i64(r[2], n) || n < 0) {
            return error(Errc::value_out_of_range);
        }
        cmd.count = static_cast<std::size_t>(n);
    }
    return Command{std::move(cmd)};
}

ParseResult parse_blpop(const Request& r) {
    BlpopCmd cmd;
    cmd.keys.assign(r.begin() + 1, r.end() - 1);
    if (auto err = parse_seconds(r.back(), cmd.timeout)) {
        return *err;
    }
    return Command{std::move(cmd)};
}

ParseResult parse_lrange(const Request& r) {
    LrangeCmd cmd{r[1], 0, 0};
    if (!parse_i64(r[2], cmd.start) || !parse_i64(r[3], cmd.stop)) {
        return error(Errc::not_an_integer);
    }
    return Command{std::move(cmd)};
}

ParseResult parse_xadd(const Request& r) {
    // key id followed by field/value pairs.
    if ((r.size() - 3) % 2 != 0) {
        return ErrorReply{wrong_arity_message("xadd")};
    }
    XaddCmd cmd{r[1], r[2], {}};
    cmd.fields.reserve((r.size() - 3) / 2);
    for (std::size_t i = 3; i < r.size(); i += 2) {
        cmd.fields.emplace_back(r[i], r[i + 1]);
    }
    return Command{std::move(cmd)};
}

ParseResult parse_xrange(const Request& r) {
    auto start = parse_range_bound(r[2], false);
    auto end = parse_range_bound(r[3], true);
    if (!start || !end) {
        return error(Errc::invalid_stream_id);
    }
    XrangeCmd cmd{r[1], *start, *end, std::nullopt};
    if (r.size() == 4) {
        return Command{std::move(cmd)};
    }
    if (r.size() != 6 || to_lower(r[4]) != "count") {
        return error(Errc::syntax_error);
    }
    int64_t n = 0;
    if (!parse_i64(r[5], n)) {
        return error(Errc::not_an_integer);
    }
    cmd.count = n;
    return Command{std::move(cmd)};
}

ParseResult parse_xread(const Request& r) {
    XreadCmd cmd;
    std::size_t i = 1;
    for (; i < r.size(); ++i) {
        const std::string opt = to_lower(r[i]);
        if (opt == "streams") {
            ++i;
            break;
        }
        if ((opt != "count" && opt != "block") || i + 1 >= r.size()) {
            return error(Errc::syntax_error);
        }
        int64_t n = 0;
        if (!parse_i64(r[i + 1], n)) {
            return error(opt == "block" ? Errc::invalid_timeout : Errc::not_an_integer);
        }
        if (opt == "count") {
            cmd.count = n > 0 ? static_cast<std::size_t>(n) : 0;
        } else {
            if (n < 0) {
                return error(Errc::negative_timeout);
            }
            cmd.block = std::chrono::milliseconds{n};
        }
        ++i;
    }

    if (i >= r.size()) {
        return error(Errc::syntax_error);
    }
    const std::size_t rest = r.size() - i;
    if (rest % 2 != 0) {
        return error(Errc::unbalanced_xread);
    }

    const std::size_t n = rest / 2;
    cmd.keys.assign(r.begin() + static_cast<std::ptrdiff_t>(i),
                    r.begin() + static_cast<std::ptrdiff_t>(i + n));
    cmd.after.reserve(n);
    for (std::size_t k = i + n; k < r.size(); ++k) {
        if (r[k] == "$") {
            cmd.after.emplace_back(std::nullopt);
            continue;
        }
        auto id = parse_stream_id(r[k]);
        if (!id) {
            return error(Errc::invalid_stream_id);
        }
        cmd.after.emplace_back(*id);
    }
    return Command{std::move(cmd)};
}

} // anonymous namespace

ParseResult parse_command(const Request& request) {
    if (auto err = check_command(request)) {
        return *err;
    }

    const std::string name = to_lower(request.front());
    const Request& r = request;

    if (name == "ping") {
        if (r.size() > 2) {
            return ErrorReply{wrong_arity_message("ping")};
        }
        PingCmd cmd;
        if (r.size() == 2) {
            cmd.message = r[1];
        }
        return Command{std::move(cmd)};
    }
    if (name == "echo") {
        return Command{EchoCmd{r[1]}};
    }
    if (name == "info") {
        InfoCmd cmd;
        for (std::size_t i = 1; i < r.size(); ++i) {
            cmd.sections.push_back(to_lower(r[i]));
        }
        return Command{std::move(cmd)};
    }
    if (name == "set") {
        return parse_set(r);
    }
    if (name == "get") {
        return Command{GetCmd{r[1]}};
    }
    if (name == "incr") {
        return Command{IncrCmd{r[1]}};
    }
    if (name == "lpush" || name == "rpush") {
        return Command{PushCmd{r[1],
                               name == "lpush" ? Storage::ListEnd::Front
                                               : Storage::ListEnd::Back,
                               {r.begin() + 2, r.end()}}};
    }
    if (name == "lpop") {
        return parse_lpop(r);
    }
    if (name == "blpop") {
        return parse_blpop(r);
    }
    if (name == "lrange") {
        return parse_lrange(r);
    }
    if (name == "llen") {
        return Command{LlenCmd{r[1]}};
    }
    if (name == "type") {
        return Command{TypeCmd{r[1]}};
    }
    if (name == "xadd") {
        return parse_xadd(r);
    }
    if (name == "xrange") {
        return parse_xrange(r);
    }
    if (name == "xread") {
        return parse_xread(r);
    }
    if (name == "multi") {
        return Command{MultiCmd{}};
    }
    if (name == "exec") {
        return Command{ExecCmd{}};
    }
    return Command{DiscardCmd{}};
}

} // namespace ember::engine
