#include "leakguard/common/utf8.hpp"

namespace leakguard::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

std::uint32_t fold_codepoint(const std::uint32_t cp) {
  if (cp >= 'A' && cp <= 'Z') {
    return cp + 0x20U;
  }
  // Latin-1 capitals, except the multiplication sign.
  if (cp >= 0xC0U && cp <= 0xDEU && cp != 0xD7U) {
    return cp + 0x20U;
  }
  // Latin Extended-A pairs capitals with the following code point. U+0130 has no
  // single-code-point lower case and is left alone.
  if ((cp >= 0x100U && cp <= 0x12FU) || (cp >= 0x132U && cp <= 0x137U) ||
      (cp >= 0x14AU && cp <= 0x177U)) {
    return (cp % 2U == 0U) ? cp + 1U : cp;
  }
  if ((cp >= 0x139U && cp <= 0x148U) || (cp >= 0x179U && cp <= 0x17EU)) {
    return (cp % 2U == 1U) ? cp + 1U : cp;
  }
  if (cp == 0x178U) {
    return 0xFFU;
  }
  return cp;
}

} // namespace

bool decode_utf8_codepoint(const std::string &input, std::size_t &index, std::uint32_t &cp,
                           std::string &raw) {
  if (index >= input.size()) {
    return false;
  }

  const unsigned char lead = static_cast<unsigned char>(input[index]);
  if (lead < 0x80U) {
    cp = lead;
    raw.assign(1, static_cast<char>(lead));
    ++index;
    return true;
  }

  std::size_t extra = 0;
  std::uint32_t value = 0;
  if ((lead & 0xE0U) == 0xC0U) {
    extra = 1;
    value = lead & 0x1FU;
  } else if ((lead & 0xF0U) == 0xE0U) {
    extra = 2;
    value = lead & 0x0FU;
  } else if ((lead & 0xF8U) == 0xF0U) {
    extra = 3;
    value = lead & 0x07U;
  } else {
    cp = lead;
    raw.assign(1, static_cast<char>(lead));
    ++index;
    return true;
  }

  if (index + extra >= input.size()) {
    cp = lead;
    raw.assign(1, static_cast<char>(lead));
    ++index;
    return true;
  }

  raw.clear();
  raw.push_back(static_cast<char>(lead));
  for (std::size_t i = 1; i <= extra; ++i) {
    const unsigned char cont = static_cast<unsigned char>(input[index + i]);
    if ((cont & 0xC0U) != 0x80U) {
      cp = lead;
      raw.assign(1, static_cast<char>(lead));
      ++index;
      return true;
    }
    value = (value << 6U) | static_cast<std::uint32_t>(cont & 0x3FU);
    raw.push_back(static_cast<char>(cont));
  }

  index += extra + 1;
  cp = value;
  return true;
}

std::size_t utf8_length(const std::string &input) {
  std::size_t count = 0;
  std::size_t index = 0;
  std::uint32_t cp = 0;
  std::string raw;
  while (decode_utf8_codepoint(input, index, cp, raw)) {
    ++count;
  }
  return count;
}

std::string utf8_truncate(const std::string &input, const std::size_t max_codepoints) {
  std::size_t count = 0;
  std::size_t index = 0;
  std::uint32_t cp = 0;
  std::string raw;
  while (count < max_codepoints && decode_utf8_codepoint(input, index, cp, raw)) {
    ++count;
  }
  return input.substr(0, index);
}

std::string utf8_to_lower(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  std::size_t index = 0;
  std::uint32_t cp = 0;
  std::string raw;
  while (decode_utf8_codepoint(input, index, cp, raw)) {
    if (raw.size() == 1 && cp >= 0x80U) {
      out += raw;
      continue;
    }
    const std::uint32_t folded = fold_codepoint(cp);
    if (folded == cp) {
      out += raw;
    } else {
      append_utf8(out, folded);
    }
  }
  return out;
}

} // namespace leakguard::common
