#include "binform/utils/value_dump.hpp"

#include "binform/utils/hex.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace binform::utils {
namespace {

struct DumpContext final {
  std::ostringstream oss;
  ValueDumpOptions options{};
};

void newline(DumpContext& ctx, std::size_t depth) {
  ctx.oss << '\n' << std::string(depth * ctx.options.indent_spaces, ' ');
}

[[nodiscard]] bool printable(const std::vector<codec::byte>& bytes) noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](codec::byte b) { return b >= 0x20 && b <= 0x7E; });
}

void append_bytes(DumpContext& ctx, const codec::Bytes& b) {
  const auto& data = b.value;
  const std::size_t max = ctx.options.max_bytes;
  const std::size_t n = max == 0 ? data.size() : std::min(data.size(), max);
  const bool truncated = n < data.size();

  ctx.oss << "bytes[" << data.size() << ']';
  if (data.empty()) {
    return;
  }
  ctx.oss << ' ';
  if (printable(data)) {
    ctx.oss << '"';
    for (std::size_t i = 0; i < n; ++i) {
      const auto c = static_cast<char>(data[i]);
      if (c == '"' || c == '\\') {
        ctx.oss << '\\';
      }
      ctx.oss << c;
    }
    ctx.oss << (truncated ? "...\"" : "\"");
    return;
  }
  ctx.oss << to_hex(core::bytes_view{data.data(), n});
  if (truncated) {
    ctx.oss << " ...";
  }
}

void append_value(DumpContext& ctx, const codec::Value& value, std::size_t depth);

// Mapping 与 Sequence 的公共外形：open + 逐项 + close，超出 max_items 时给出剩余个数。
template <class Items, class AppendItem>
void append_container(DumpContext& ctx, const Items& items, char open, char close, std::size_t depth,
                      AppendItem&& append_item) {
  const auto& opt = ctx.options;
  if (items.empty()) {
    ctx.oss << open << close;
    return;
  }
  if (depth >= opt.max_depth) {
    ctx.oss << open << "..." << close;
    return;
  }
  const std::size_t n = opt.max_items == 0 ? items.size() : std::min(items.size(), opt.max_items);
  ctx.oss << open;
  for (std::size_t i = 0; i < n; ++i) {
    if (opt.multiline) {
      newline(ctx, depth + 1);
    } else if (i != 0) {
      ctx.oss << ", ";
    }
    append_item(items[i]);
  }
  if (n < items.size()) {
    if (opt.multiline) {
      newline(ctx, depth + 1);
    } else {
      ctx.oss << ", ";
    }
    ctx.oss << "... (" << (items.size() - n) << " more)";
  }
  if (opt.multiline) {
    newline(ctx, depth);
  }
  ctx.oss << close;
}

void append_value(DumpContext& ctx, const codec::Value& value, std::size_t depth) {
  std::visit(
    [&](const auto& v) {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, std::int64_t>) {
        ctx.oss << "i64 " << v;
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        ctx.oss << "u64 " << v;
      } else if constexpr (std::is_same_v<T, double>) {
        ctx.oss << "f64 " << std::setprecision(10) << v;
      } else if constexpr (std::is_same_v<T, codec::Bytes>) {
        append_bytes(ctx, v);
      } else if constexpr (std::is_same_v<T, codec::Sequence>) {
        ctx.oss << "seq[" << v.size() << "] ";
        append_container(ctx, v, '[', ']', depth,
                         [&](const codec::Value& item) { append_value(ctx, item, depth + 1); });
      } else {
        append_container(ctx, v.fields(), '{', '}', depth, [&](const codec::Field& f) {
          ctx.oss << f.name << ": ";
          append_value(ctx, f.value, depth + 1);
        });
      }
    },
    value.storage());
}

}  // namespace

std::string dump_value(const codec::Value& value, ValueDumpOptions options) {
  DumpContext ctx;
  ctx.options = options;
  append_value(ctx, value, 0);
  return ctx.oss.str();
}

std::string dump_value(const codec::Mapping& mapping, ValueDumpOptions options) {
  DumpContext ctx;
  ctx.options = options;
  append_container(ctx, mapping.fields(), '{', '}', 0, [&](const codec::Field& f) {
    ctx.oss << f.name << ": ";
    append_value(ctx, f.value, 1);
  });
  return ctx.oss.str();
}

}  // namespace binform::utils
