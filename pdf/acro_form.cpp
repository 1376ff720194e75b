/* File: acro_form.cpp
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

#include "acro_form.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

#include "logger_utils.hpp"
#include "pdf_defs.hpp"
#include "pdf_structs.hpp"
#include "pdf_utils.hpp"

namespace pdfseal::pdf {

std::string AcroForm::ToString() const {
  std::ostringstream builder;
  builder << id.ToString() << "\n"
          << kDictStart << "\n"
          << kTagFields << " [ ";
  for (const auto &field : fields) {
    builder << field.ToStringRef() << " ";
  }
  builder << "]\n";
  builder << kTagSigFlags << " " << sig_flags << "\n";
  for (const auto &field_pair : other_fields_copied) {
    builder << field_pair.first << " " << field_pair.second << "\n";
  }
  builder << kDictEnd << "\n" << kObjEnd;
  return builder.str();
}

AcroForm AcroForm::ShallowCopy(const PtrPdfObjShared &other) {
  if (!other || !other->isDictionary()) {
    throw std::runtime_error("[AcroForm::ShallowCopy] not a dictionary");
  }
  AcroForm res;
  res.id = ObjRawId::CopyIdFromExisting(*other);
  if (other->hasKey(kTagFields) && other->getKey(kTagFields).isArray()) {
    size_t dropped = 0;
    for (auto &lnk : other->getKey(kTagFields).getArrayAsVector()) {
      if (lnk.isIndirect()) {
        res.fields.push_back(ObjRawId::CopyIdFromExisting(lnk));
      } else {
        ++dropped;
      }
    }
    if (dropped > 0) {
      auto logger = logger::InitLog();
      if (logger) {
        logger->warn("[AcroForm::ShallowCopy] {} direct fields dropped",
                     dropped);
      }
    }
  }
  // copy all the rest fields except SigFlags,Fields
  for (const auto &field_pair : DictToUnparsedMap(*other)) {
    if (field_pair.first != kTagFields && field_pair.first != kTagSigFlags) {
      res.other_fields_copied.insert(field_pair);
    }
  }
  return res;
}

} // namespace pdfseal::pdf
