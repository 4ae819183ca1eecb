#include "wecdsa/math/encoding.hpp"

#include <stdexcept>

namespace wecdsa {

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  mpz_class out;
  if (bytes.empty()) {
    return out;
  }
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

Bytes ExportFixedWidth(const mpz_class& value, size_t width) {
  if (value < 0) {
    throw std::invalid_argument("Cannot export a negative integer");
  }

  Bytes out(width, 0);
  if (value == 0) {
    return out;
  }

  const size_t needed = (mpz_sizeinbase(value.get_mpz_t(), 2) + 7) / 8;
  if (needed > width) {
    throw std::invalid_argument("Integer does not fit the requested width");
  }

  size_t count = 0;
  mpz_export(out.data() + (width - needed), &count, 1, sizeof(uint8_t), 1, 0, value.get_mpz_t());
  if (count != needed) {
    throw std::runtime_error("mpz_export wrote an unexpected byte count");
  }
  return out;
}

}  // namespace wecdsa
