#include <hcert/common/logging.h>

#include <hcert/decoder/hcert_decoder.h>

#include <hcert/validation/certificate_validator.h>
#include <hcert/validation/signature_verifier.h>
#include <hcert/validation/validation_result.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace {

std::string ReadAllText(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("failed to open file: " + path);
  }
  return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

// Trailing newlines from files and stdin are not part of the certificate.
std::string TrimTrailingWhitespace(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
    s.pop_back();
  }
  return s;
}

std::string FormatDate(const hcert::decoder::Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()), static_cast<unsigned>(d.month()),
                static_cast<unsigned>(d.day()));
  return buf;
}

std::string FormatTimestamp(hcert::decoder::Timestamp ts) {
  const std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

void PrintCertificate(const hcert::decoder::Certificate& cert) {
  std::cout << "issuer: " << cert.issuer() << "\n";
  std::cout << "issued_at: " << FormatTimestamp(cert.issued_at()) << "\n";
  std::cout << "expires_at: " << FormatTimestamp(cert.expires_at()) << "\n";
  std::cout << "version: " << cert.schema_version() << "\n";
  std::cout << "name: " << cert.name().standardised_family_name;
  if (cert.name().standardised_given_name) {
    std::cout << " " << *cert.name().standardised_given_name;
  }
  std::cout << "\n";
  std::cout << "date_of_birth: " << cert.date_of_birth() << "\n";

  std::visit(
      [](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, hcert::decoder::VaccinationEntry>) {
          std::cout << "vaccination: " << e.medicinal_product << " dose " << e.dose_number << "/"
                    << e.total_series_of_doses << " on " << FormatDate(e.date_of_vaccination) << "\n";
        } else if constexpr (std::is_same_v<T, hcert::decoder::TestEntry>) {
          std::cout << "test: " << e.type_of_test << " result " << e.test_result << " collected "
                    << FormatTimestamp(e.sample_collected_at) << "\n";
        } else {
          std::cout << "recovery: valid " << FormatDate(e.valid_from) << " to " << FormatDate(e.valid_until) << "\n";
        }
      },
      cert.content());
}

void PrintResult(const hcert::validation::ValidationResult& r) {
  std::cout << "is_valid: " << (r.is_valid ? "true" : "false") << "\n";
  std::cout << "validator: " << r.validator_name << "\n";

  if (!r.metadata.empty()) {
    std::cout << "metadata:\n";
    for (const auto& kv : r.metadata) {
      std::cout << "  " << kv.first << ": " << kv.second << "\n";
    }
  }

  if (!r.failures.empty()) {
    std::cout << "failures:\n";
    for (const auto& f : r.failures) {
      std::cout << "- " << f.message;
      if (f.error_code) {
        std::cout << " (" << *f.error_code << ")";
      }
      std::cout << "\n";

      if (f.property_name) {
        std::cout << "  property: " << *f.property_name << "\n";
      }
      if (f.unsatisfied_rule) {
        std::cout << "  rule: " << f.unsatisfied_rule->tag() << "\n";
      }
    }
  }
}

std::string GetArgValue(int argc, char** argv, const std::string& name) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == name) {
      if (i + 1 >= argc) {
        throw std::runtime_error("missing value for " + name);
      }
      return argv[i + 1];
    }
  }
  return {};
}

bool HasFlag(int argc, char** argv, const std::string& name) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == name) {
      return true;
    }
  }
  return false;
}

// The first argument that is neither an option nor an option's value.
std::string GetPositional(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--prefix" || arg == "--config" || arg == "--public-key") {
      ++i;
      continue;
    }
    if (arg == "--verbose") {
      continue;
    }
    return arg;
  }
  return {};
}

[[noreturn]] void PrintUsageAndExit(const char* exe) {
  std::cerr << "Usage:\n"
            << "  " << exe << " [--config <json>] [--prefix <text>] [--public-key <pem>] [--verbose] <certificate|->\n"
            << "\n"
            << "Decodes an HC1 health certificate, prints its content and checks it against the default\n"
            << "validation rule. With --public-key the COSE signature is verified as well.\n";
  std::exit(2);
}

} // namespace

int main(int argc, char** argv) {
  try {
    const std::string input_arg = GetPositional(argc, argv);
    if (input_arg.empty() || HasFlag(argc, argv, "--help")) {
      PrintUsageAndExit(argv[0]);
    }

    if (HasFlag(argc, argv, "--verbose")) {
      hcert::common::SetLogLevel("debug");
    }

    const std::string config_path = GetArgValue(argc, argv, "--config");
    hcert::decoder::DecoderOptions options;
    if (!config_path.empty()) {
      options = hcert::decoder::LoadDecoderOptions(config_path);
    }
    if (HasFlag(argc, argv, "--prefix")) {
      options.prefix = GetArgValue(argc, argv, "--prefix");
    }

    std::string text;
    if (input_arg == "-") {
      text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
      text = input_arg;
    }
    text = TrimTrailingWhitespace(std::move(text));

    const hcert::decoder::HcertDecoder decoder(std::move(options));
    const auto decoded = decoder.Decode(text);
    if (!decoded.is_valid) {
      std::cerr << "decode failed: " << decoded.error->Message() << "\n";
      return 1;
    }

    const auto& cert = *decoded.certificate;
    PrintCertificate(cert);

    bool ok = true;

    const std::string key_path = GetArgValue(argc, argv, "--public-key");
    if (!key_path.empty()) {
      const auto key = hcert::validation::LoadPublicKeyFromPem(ReadAllText(key_path));
      if (!key) {
        std::cerr << "failed to load public key: " << key_path << "\n";
        return 1;
      }

      hcert::validation::VerifyOptions verify;
      verify.public_key_bytes = *key;
      const auto signature = hcert::validation::VerifyCertificateSignature(cert.envelope(), verify, "Signature");
      PrintResult(signature);
      ok = ok && signature.is_valid;
    }

    const auto policy = hcert::validation::CertificateValidator("DefaultRule").Validate(cert);
    PrintResult(policy);
    ok = ok && policy.is_valid;

    return ok ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}
