#pragma once

#include "tnc_exception.hpp"

namespace tnc {

/// Thrown when a caller provides a value outside of the accepted domain (nonce length, encoded text...).
class invalid_argument : public exception {
 public:
  using exception::exception;
};

}  // namespace tnc
