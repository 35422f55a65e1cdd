#include "binform/codec/error.hpp"

#include <string>

namespace binform::codec {
namespace {

class binform_codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "binform.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::missing_field:
        return "missing field in value scope";
      case errc::insufficient_data:
        return "insufficient data";
      case errc::length_mismatch:
        return "length mismatch";
      case errc::checksum_mismatch:
        return "checksum mismatch";
      case errc::duplicate_field:
        return "duplicate field name";
      case errc::schema_order:
        return "invalid field order in schema";
      case errc::unknown_variant:
        return "unknown message variant";
      case errc::type_mismatch:
        return "value type does not match schema";
      case errc::invalid_schema:
        return "invalid schema";
      case errc::padding_mismatch:
        return "padding bytes mismatch";
      case errc::duplicate_variant:
        return "duplicate message variant";
      default:
        return "unknown binform.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static binform_codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace binform::codec
