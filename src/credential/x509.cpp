// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <ctype.h>
#include <string.h>
#include <time.h>

#include <string>
#include <vector>

#include <stout/error.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/stringify.hpp>
#include <stout/strings.hpp>

#include "credential/x509.hpp"

using process::Time;

using std::string;
using std::vector;

namespace gridware {
namespace internal {
namespace x509 {

Try<vector<string>> certificates(const string& pem)
{
  BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
  if (bio == nullptr) {
    return Error("Failed to allocate BIO: " + errors());
  }

  vector<string> result;

  ERR_clear_error();

  while (true) {
    X509* certificate = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);

    if (certificate == nullptr) {
      unsigned long code = ERR_peek_last_error();

      // Running out of PEM blocks is the expected way to stop.
      if (ERR_GET_LIB(code) == ERR_LIB_PEM &&
          ERR_GET_REASON(code) == PEM_R_NO_START_LINE) {
        ERR_clear_error();
        break;
      }

      BIO_free(bio);
      return Error("Failed to read certificate: " + errors());
    }

    Try<string> der = encode(certificate);
    X509_free(certificate);

    if (der.isError()) {
      BIO_free(bio);
      return Error(der.error());
    }

    result.push_back(der.get());
  }

  BIO_free(bio);

  return result;
}


Try<Certificate> decode(const string& der)
{
  const unsigned char* data =
    reinterpret_cast<const unsigned char*>(der.data());

  const unsigned char* end = data + der.size();

  X509* certificate = d2i_X509(nullptr, &data, static_cast<long>(der.size()));
  if (certificate == nullptr) {
    return Error("Failed to decode certificate: " + errors());
  }

  if (data != end) {
    X509_free(certificate);
    return Error("Trailing bytes after certificate");
  }

  return Certificate(certificate, X509_free);
}


Try<string> encode(X509* certificate)
{
  int length = i2d_X509(certificate, nullptr);
  if (length <= 0) {
    return Error("Failed to encode certificate: " + errors());
  }

  string der(static_cast<size_t>(length), '\0');
  unsigned char* data = reinterpret_cast<unsigned char*>(&der[0]);

  if (i2d_X509(certificate, &data) != length) {
    return Error("Failed to encode certificate: " + errors());
  }

  return der;
}


string name(X509_NAME* name)
{
  char* buffer = X509_NAME_oneline(name, nullptr, 0);
  if (buffer == nullptr) {
    return "";
  }

  string result(buffer);
  OPENSSL_free(buffer);

  return result;
}


Try<Time> time(const ASN1_TIME* time)
{
  struct tm tm;
  memset(&tm, 0, sizeof(tm));

  if (ASN1_TIME_to_tm(time, &tm) != 1) {
    return Error("Invalid certificate time: " + errors());
  }

  return Time::create(static_cast<double>(::timegm(&tm)));
}


bool isProxy(X509* certificate)
{
  if (X509_get_extension_flags(certificate) & EXFLAG_PROXY) {
    return true;
  }

  X509_NAME* subject = X509_get_subject_name(certificate);
  X509_NAME* issuer = X509_get_issuer_name(certificate);

  int count = X509_NAME_entry_count(subject);
  if (count < 2) {
    return false;
  }

  X509_NAME_ENTRY* last = X509_NAME_get_entry(subject, count - 1);
  if (OBJ_obj2nid(X509_NAME_ENTRY_get_object(last)) != NID_commonName) {
    return false;
  }

  ASN1_STRING* data = X509_NAME_ENTRY_get_data(last);
  const string value(
      reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)),
      static_cast<size_t>(ASN1_STRING_length(data)));

  bool numeric = !value.empty();
  foreach (char c, value) {
    numeric = numeric && isdigit(static_cast<unsigned char>(c));
  }

  if (value != "proxy" && value != "limited proxy" && !numeric) {
    return false;
  }

  // The remaining subject has to be the issuer.
  X509_NAME* parent = X509_NAME_dup(subject);
  if (parent == nullptr) {
    return false;
  }

  X509_NAME_ENTRY_free(X509_NAME_delete_entry(parent, count - 1));

  bool proxy = X509_NAME_cmp(parent, issuer) == 0;
  X509_NAME_free(parent);

  return proxy;
}


Result<string> extension(X509* certificate, const string& oid)
{
  ASN1_OBJECT* object = OBJ_txt2obj(oid.c_str(), 1);
  if (object == nullptr) {
    return Error("Invalid object identifier '" + oid + "'");
  }

  int index = X509_get_ext_by_OBJ(certificate, object, -1);
  ASN1_OBJECT_free(object);

  if (index < 0) {
    return None();
  }

  X509_EXTENSION* extension = X509_get_ext(certificate, index);
  ASN1_OCTET_STRING* data = X509_EXTENSION_get_data(extension);

  const unsigned char* bytes = ASN1_STRING_get0_data(data);
  long length = ASN1_STRING_length(data);

  // The value is a DER encoded string; fall back to the raw bytes for
  // extensions written without the string wrapping.
  ASN1_TYPE* value = d2i_ASN1_TYPE(nullptr, &bytes, length);
  if (value == nullptr) {
    ERR_clear_error();
    return string(
        reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)),
        static_cast<size_t>(length));
  }

  Result<string> result = None();

  switch (ASN1_TYPE_get(value)) {
    case V_ASN1_UTF8STRING:
    case V_ASN1_IA5STRING:
    case V_ASN1_PRINTABLESTRING:
    case V_ASN1_OCTET_STRING:
      result = string(
          reinterpret_cast<const char*>(
              ASN1_STRING_get0_data(value->value.asn1_string)),
          static_cast<size_t>(ASN1_STRING_length(value->value.asn1_string)));
      break;
    default:
      result = Error(
          "Unexpected type " + stringify(ASN1_TYPE_get(value)) +
          " of extension '" + oid + "'");
      break;
  }

  ASN1_TYPE_free(value);

  return result;
}


bool isAuthority(X509* certificate)
{
  return X509_check_ca(certificate) > 0;
}


bool signedBy(X509* certificate, X509* issuer)
{
  EVP_PKEY* key = X509_get0_pubkey(issuer);
  if (key == nullptr) {
    ERR_clear_error();
    return false;
  }

  if (X509_verify(certificate, key) != 1) {
    ERR_clear_error();
    return false;
  }

  return true;
}


string error_string(unsigned long code)
{
  // SSL library guarantees to stay within 120 bytes.
  char buffer[128];

  ERR_error_string_n(code, buffer, sizeof(buffer));
  return string(buffer);
}


string errors()
{
  vector<string> messages;

  unsigned long code;
  while ((code = ERR_get_error()) != 0) {
    messages.push_back(error_string(code));
  }

  if (messages.empty()) {
    return "unknown error";
  }

  return strings::join("; ", messages);
}

} // namespace x509 {
} // namespace internal {
} // namespace gridware {
