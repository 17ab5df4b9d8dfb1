// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file record_materializer.h
 * @brief Turns the CBOR claims map of a COSE payload into CertificateClaims.
 */

#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <tinycbor/cbor.h>

#include "hcert/decoder/certificate.h"
#include "hcert/decoder/decoder_options.h"

namespace hcert::decoder {

struct MaterializationError {
  enum class Kind {
    // The CBOR item could not be represented as a generic JSON document.
    kPayloadConversion,
    // The JSON document does not satisfy the certificate schema.
    kSchemaDecoding,
  };

  Kind kind = Kind::kPayloadConversion;
  std::optional<std::string> cause;
};

/**
 * @brief Materializes the claims map at @p value.
 *
 * The CBOR map is converted to a JSON tree, serialized, parsed back and then deserialized
 * field by field into the certificate schema.
 */
bool MaterializeClaims(CborValue value,
                       const SchemaOptions& options,
                       CertificateClaims& out,
                       MaterializationError* out_error = nullptr);

/**
 * @brief Deserializes an already converted claims document.
 * @throws std::invalid_argument naming the JSON path of the offending field.
 */
CertificateClaims ParseClaims(const nlohmann::json& document, const SchemaOptions& options = {});

} // namespace hcert::decoder
