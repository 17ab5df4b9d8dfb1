// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/decoder/certificate.h"

#include <utility>

namespace hcert::decoder {

Certificate::Certificate(CertificateClaims claims, CryptographicEnvelope envelope, std::string text_representation)
    : claims_(std::move(claims)), envelope_(std::move(envelope)), text_representation_(std::move(text_representation)) {}

} // namespace hcert::decoder
