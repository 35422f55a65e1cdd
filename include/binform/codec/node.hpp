#pragma once

#include "binform/codec/error.hpp"
#include "binform/codec/types.hpp"
#include "binform/codec/value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace binform::codec {

class Node;
using NodePtr = std::shared_ptr<const Node>;

// 统计待编码序列的元素个数（dynamic 长度策略使用，默认按 Sequence/Bytes 的 size 计数）。
using CountFn = std::function<std::size_t(const Value&)>;

// 校验算法：输入子节点编码后的字节，输出校验码（由 Checksum 节点截断到自身宽度）。
using ChecksumFn = std::function<std::uint64_t(bytes_view)>;

enum class NumericKind : std::uint8_t {
  integer = 0,
  floating = 1,
};

/**
 * @brief 定宽数值（整数 1/2/4/8 字节，浮点 4/8 字节）。
 *
 * 超出宽度的整数按二进制补码截断（与硬件定宽语义一致），不视为错误。
 */
struct Numeric final {
  NumericKind kind{NumericKind::integer};
  bool is_signed{false};
  std::uint8_t width{1};
  ByteOrder order{kNetworkOrder};
};

enum class SequenceKind : std::uint8_t {
  array = 0,
  bytes = 1,
};

/**
 * @brief 序列编解码（元素个数由外层长度策略提供，而不是序列自己决定）。
 *
 * - array：element 为元素类型（Numeric / Struct / fixed 序列），元素名不参与查找；
 * - bytes：原始字节串，定长时截断或补 NUL；
 * - reverse：线上顺序与语义顺序相反（编码前反转，解码后反转）。
 */
struct SequenceCodec final {
  SequenceKind kind{SequenceKind::bytes};
  NodePtr element{};
  bool reverse{false};
};

enum class LengthKind : std::uint8_t {
  fixed = 0,
  dynamic = 1,
  consume = 2,
};

struct LengthPolicy final {
  LengthKind kind{LengthKind::fixed};
  std::size_t count{0};       // fixed 使用
  std::string length_field{};  // dynamic 使用：同层长度字段名
  CountFn count_fn{};          // dynamic 使用：为空时按元素个数计数
};

// 长度策略 + 被包装的序列：作为一个整体出现在 Struct 中。
struct Sized final {
  SequenceCodec sequence{};
  LengthPolicy policy{};
};

/**
 * @brief dynamic 长度绑定（schema 编译期一次性解析，之后只读）。
 *
 * - 编码 Struct 时：先按 count_fn 计算 data_field 的元素个数，写回 length_field，再逐字段编码；
 * - 解码 Struct 时：length_field 先于 data_field 解码，data_field 直接读取已解码的计数。
 */
struct LengthBinding final {
  std::string length_field{};
  std::string data_field{};
  Numeric length_codec{};
  CountFn count_fn{};
};

/**
 * @brief 有序、具名的子节点集合（自身构成一层命名空间）。
 *
 * 只能通过 StructBuilder::build() 得到，构造时已完成全部校验与绑定。
 */
struct Struct final {
  std::vector<Node> children{};
  std::vector<LengthBinding> bindings{};

  [[nodiscard]] const LengthBinding* binding_for(std::string_view data_field) const noexcept;
};

enum class ChecksumPlacement : std::uint8_t {
  trailing = 0,  // child 字节在前，校验码在后
  leading = 1,   // 校验码在前，child 字节在后
};

/**
 * @brief 包裹一个子节点，对其编码结果计算校验码。
 *
 * child 与 Checksum 共享同一层值作用域；校验码本身以 Checksum 节点名写入该作用域。
 */
struct Checksum final {
  Numeric code{};
  ChecksumFn fn{};
  NodePtr child{};
  ChecksumPlacement placement{ChecksumPlacement::trailing};
};

// 固定填充字节：不占用值作用域，解码时校验内容一致。
struct Padding final {
  std::vector<byte> pattern{};
};

/**
 * @brief schema 树的节点。
 *
 * 节点集合是封闭的（Numeric / Sized / Struct / Checksum / Padding），
 * 编解码对 body 做 std::visit 分派。节点构造完成后按只读元数据使用，
 * 可在多个线程的 encode/decode 调用之间共享。
 */
class Node final {
 public:
  using body_type = std::variant<Numeric, Sized, Struct, Checksum, Padding>;

  Node();
  Node(std::string name, body_type body);

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const body_type& body() const noexcept { return body_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&body_);
  }

  [[nodiscard]] bool is_struct() const noexcept { return std::holds_alternative<Struct>(body_); }

 private:
  std::string name_;
  body_type body_;
};

// ---- 数值 ----

[[nodiscard]] Node u8(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node u16(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node u32(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node u64(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node i8(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node i16(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node i32(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node i64(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node f32(std::string name, ByteOrder order = kNetworkOrder);
[[nodiscard]] Node f64(std::string name, ByteOrder order = kNetworkOrder);

// 运行期指定宽度：width 非 1/2/4/8（浮点非 4/8）时返回 errc::invalid_schema。
std::error_code integer(std::string name, bool is_signed, std::uint8_t width, ByteOrder order, Node& out);
std::error_code floating(std::string name, std::uint8_t width, ByteOrder order, Node& out);

// ---- 序列与长度策略 ----

// 尚未指定长度策略的序列（必须再经 fixed/dynamic/consume 包装成 Node）。
struct SequenceSpec final {
  std::string name;
  SequenceCodec sequence;
};

[[nodiscard]] SequenceSpec array(std::string name, Node element, bool reverse = false);
[[nodiscard]] SequenceSpec bytes(std::string name, bool reverse = false);

std::error_code fixed(std::size_t count, SequenceSpec seq, Node& out);
std::error_code dynamic(std::string length_field, SequenceSpec seq, Node& out, CountFn count_fn = {});
std::error_code consume(SequenceSpec seq, Node& out);

// ---- 其它 ----

struct ChecksumOptions final {
  ChecksumPlacement placement{ChecksumPlacement::trailing};
  ByteOrder order{kNetworkOrder};
};

/**
 * @brief 构造 Checksum 节点。
 *
 * - width 为校验码字节数（1/2/4/8）；
 * - child 以 consume 序列结尾时无法定位校验码，返回 errc::schema_order。
 */
std::error_code checksum(std::string name, std::uint8_t width, ChecksumFn fn, Node child, Node& out,
                         ChecksumOptions options = {});

[[nodiscard]] Node padding(std::vector<byte> pattern);

/**
 * @brief Struct 的组装器（两阶段：先收集子节点，build() 时一次性校验与绑定）。
 *
 * build() 检查：
 * - 同层字段重名 -> errc::duplicate_field
 * - consume 序列（或以其结尾的嵌套 Struct）后面还有字段 -> errc::schema_order
 * - dynamic 引用的长度字段未声明、位于其后或不是整数 -> errc::schema_order
 *
 * 链式 add 中传入的失败结果（见 add(std::error_code, Node)）会延迟到 build() 返回。
 */
class StructBuilder final {
 public:
  explicit StructBuilder(std::string name = {});

  StructBuilder& add(Node child);
  StructBuilder& add(std::error_code ec, Node child);

  StructBuilder& fixed(std::size_t count, SequenceSpec seq);
  StructBuilder& dynamic(std::string length_field, SequenceSpec seq, CountFn count_fn = {});
  StructBuilder& consume(SequenceSpec seq);
  StructBuilder& padding(std::vector<byte> pattern);

  std::error_code build(Node& out) const;

 private:
  std::string name_;
  std::vector<Node> children_;
  std::error_code deferred_{};
};

// 节点（或以其为末尾的嵌套结构）是否“吃掉剩余全部字节”。
[[nodiscard]] bool consumes_rest(const Node& node) noexcept;

// 在 node（含任意层 Checksum 包裹）中查找名为 name 的 Numeric，找不到返回 nullptr。
[[nodiscard]] const Numeric* find_scope_numeric(const Node& node, std::string_view name) noexcept;

// 默认计数：Sequence 的元素数 / Bytes 的字节数，其它类型为 0。
[[nodiscard]] std::size_t count_elements(const Value& value) noexcept;

}  // namespace binform::codec
