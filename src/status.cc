#include "status.hh"

#include "format.hh"

namespace chacha {

Str ToStr(Error code) {
  switch (code) {
  case Error::Other:
    return "Other";
  case Error::InvalidKeyLength:
    return "InvalidKeyLength";
  case Error::InvalidNonceLength:
    return "InvalidNonceLength";
  case Error::IndexOutOfRange:
    return "IndexOutOfRange";
  case Error::SelfTestFailed:
    return "SelfTestFailed";
  }
  return f("Error(%d)", (int)code);
}

Status::Status() = default;

Str &Status::operator()(const std::source_location location_arg) {
  return (*this)(Error::Other, location_arg);
}

Str &Status::operator()(Error code, const std::source_location location_arg) {
  entry.reset(new Entry{.next = std::move(entry),
                        .location = location_arg,
                        .code = code,
                        .message = {},
                        .advice = {}});
  return entry->message;
}

void AppendErrorAdvice(Status &status, StrView advice) {
  if (status.entry) {
    status.entry->advice += advice;
  }
}

bool Status::Ok() const { return entry == nullptr; }

Error Status::Code() const {
  Error code = Error::Other;
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (i->code != Error::Other) {
      code = i->code;
    }
  }
  return code;
}

Str Status::ToStr() const {
  Str ret;
  for (Entry *i = entry.get(); i != nullptr; i = i->next.get()) {
    if (!ret.empty()) {
      ret += " ";
    }
    ret += i->message;
    if (!ret.empty()) {
      ret += " ";
    }
    auto &location = i->location;
    ret += f("(%s:%d).", location.file_name(), (int)location.line());
    if (!i->advice.empty()) {
      ret += " ";
      ret += i->advice;
    }
  }
  return ret;
}

void Status::Reset() { entry.reset(); }

} // namespace chacha
