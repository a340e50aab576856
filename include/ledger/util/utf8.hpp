#ifndef LEDGER_UTF8_HPP_
#define LEDGER_UTF8_HPP_

#include <string>

namespace ledger {
namespace util {

/**
 * True if `text` is well-formed UTF-8: no stray continuation bytes, no
 * overlong forms, no surrogates and nothing above U+10FFFF.
 * nlohmann::json refuses to dump strings that fail this check.
 */
bool isValidUtf8(const std::string& text);

}  // namespace util
}  // namespace ledger

#endif  // LEDGER_UTF8_HPP_
