#pragma once

#include "text-nonce.hpp"
#include "text-nonce.pb.h"

namespace tnc {

::proto::TextNonce ConvertTextNonceToProto(const TextNonce &textNonce);

TextNonce ConvertTextNonceFromProto(const ::proto::TextNonce &protoTextNonce);

}  // namespace tnc
