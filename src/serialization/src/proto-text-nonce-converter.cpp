#include "proto-text-nonce-converter.hpp"

#include "text-nonce.hpp"
#include "text-nonce.pb.h"
#include "tnc_string.hpp"

namespace tnc {

::proto::TextNonce ConvertTextNonceToProto(const TextNonce &textNonce) {
  ::proto::TextNonce protoObj;

  protoObj.set_text(string(textNonce.str()));

  return protoObj;
}

TextNonce ConvertTextNonceFromProto(const ::proto::TextNonce &protoTextNonce) {
  return TextNonce(string(protoTextNonce.text()));
}

}  // namespace tnc
