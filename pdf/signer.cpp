/* File: signer.cpp
Copyright (C) Basealt LLC,  2024
Author: Oleg Proskurin, <proskurinov@basealt.ru>

This program is free software; you can redistribute it and/or
modify it under the terms of the GNU Lesser General Public
License as published by the Free Software Foundation; either
version 3 of the License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program; if not, write to the Free Software Foundation,
Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301, USA.
*/

#include "signer.hpp"

#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include "byte_spans.hpp"
#include "canonicalizer.hpp"
#include "errors.hpp"
#include "i_sign_scheme.hpp"
#include "logger_utils.hpp"
#include "pdf.hpp"
#include "utils.hpp"
#include "watermark.hpp"

namespace pdfseal::pdf {

SignResult Signer::Sign(const BytesVector &pdf_data,
                        const std::string &signer_name,
                        const std::string &extra,
                        const SignOptions &options) const {
  const std::string func_name = "[Signer::Sign] ";
  auto logger = logger::InitLog();
  // one keypair for the whole call
  const auto key_pair = key_store_.Snapshot();
  if (!key_pair) {
    throw NoKeyLoadedError(func_name + "no signing key loaded");
  }
  const std::string name = TrimWhitespace(signer_name);
  if (name.empty()) {
    throw InvalidInputError(func_name + "signer name is empty");
  }
  Pdf full_doc;
  full_doc.Open(pdf_data);
  if (full_doc.IsEncrypted()) {
    throw InvalidInputError(func_name + "encrypted documents are not supported");
  }
  const CanonicalRange range = ComputeRange(full_doc);
  if (range.has_record && logger) {
    logger->info("{}replacing the existing signature", func_name);
    if (range.modified_after_signing) {
      logger->warn("{}the document was modified after signing, the changes "
                   "are dropped",
                   func_name);
    }
  }

  SignatureRecord record;
  record.signer_name = name;
  record.extra = extra;
  record.digest_algo = options.digest;
  record.sig_algo = options.signature;
  record.key_id = key_pair->key_id;
  record.canonical_length = range.canonical_length;
  try {
    const auto scheme =
      crypto::CreateSignScheme(options.digest, options.signature);
    record.content_digest = scheme->Digest(pdf_data, range.ranges);
    // captured once, the record and the watermark show the same time
    record.timestamp = TimePointToIso8601(clock_());
    if (!Iso8601ToTimeT(record.timestamp)) {
      throw InvalidInputError(func_name +
                              "the clock returned an invalid time");
    }
    record.signature = scheme->Sign(key_pair->private_key.get(),
                                    record.ToSignedAttributes().Encode());
  } catch (const PdfSealError &) {
    throw;
  } catch (const std::exception &ex) {
    // the algorithms or the key can't be used
    throw InvalidInputError(func_name + ex.what());
  }

  std::vector<std::string> watermark_lines;
  if (options.watermark) {
    watermark_lines = WatermarkLines(name, record.timestamp, extra,
                                     options.digest, record.content_digest);
  }
  // the update follows [0,N), a previous signing update is dropped
  Pdf base_doc;
  Pdf *target_doc = &full_doc;
  if (range.has_record) {
    base_doc.Open(pdf_data.data(), range.canonical_length);
    target_doc = &base_doc;
  }
  BytesVector update;
  try {
    update = target_doc->CreateSignedUpdate(record, watermark_lines);
  } catch (const PdfSealError &) {
    throw;
  } catch (const std::exception &ex) {
    throw UnparsableDocumentError(func_name + ex.what());
  }
  ByteSpans output(pdf_data.data(), range.canonical_length);
  output.Append(std::move(update));

  SignResult res;
  res.signed_data = output.Flatten();
  res.record = std::move(record);
  if (logger) {
    logger->info("{}signed by key {}, {} bytes", func_name,
                 VecBytesStringRepresentation(res.record.key_id),
                 res.signed_data.size());
  }
  return res;
}

} // namespace pdfseal::pdf
