#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

#include "storyloom/util/json.h"

#define SL_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

static std::string parse_error_message(const std::string& text) {
  try {
    (void)storyloom::json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json_errors() {
  // Errors carry line/col so hand-edited world files are easy to fix.

  // Stray comma in an array.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    SL_ASSERT(!msg.empty());
    SL_ASSERT(msg.find("line 3, col 3") != std::string::npos);
    SL_ASSERT(msg.find("unexpected") != std::string::npos);
  }

  // Same stray comma with CRLF line endings.
  {
    const std::string msg = parse_error_message("[\r\n  1,\r\n  ,\r\n  2\r\n]\r\n");
    SL_ASSERT(!msg.empty());
    SL_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }

  // Missing closing brace at end of file.
  {
    const std::string msg = parse_error_message("{\n  \"a\": 1,\n  \"b\": 2");
    SL_ASSERT(!msg.empty());
    SL_ASSERT(msg.find("line 3, col 9") != std::string::npos);
    SL_ASSERT(msg.find("expected") != std::string::npos);
  }

  // Trailing garbage.
  {
    const std::string msg = parse_error_message("{} {}");
    SL_ASSERT(msg.find("trailing") != std::string::npos);
  }

  // A UTF-8 BOM is tolerated.
  {
    const auto v = storyloom::json::parse("\xEF\xBB\xBF{\"name\": \"Vale\"}");
    SL_ASSERT(v.is_object());
    SL_ASSERT(storyloom::json::string_or(v.object(), "name") == "Vale");
  }

  // Escapes and surrogate pairs decode to UTF-8.
  {
    const auto v = storyloom::json::parse("\"a\\n\\u00e9\\ud83d\\ude00\"");
    SL_ASSERT(v.string_value() == "a\n\xC3\xA9\xF0\x9F\x98\x80");
  }

  // Output is stable: keys sorted, non-finite numbers written as null.
  {
    storyloom::json::Object o;
    o["zeta"] = 1.0;
    o["alpha"] = std::string("x");
    o["mid"] = std::nan("");
    const std::string text = storyloom::json::stringify(o, 0);
    SL_ASSERT(text.find("alpha") < text.find("mid"));
    SL_ASSERT(text.find("mid") < text.find("zeta"));
    SL_ASSERT(text.find("\"mid\":null") != std::string::npos);
  }

  return 0;
}
