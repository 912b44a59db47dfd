#include "vesper/config/schema.hpp"

namespace vesper::config {

std::string json_schema() {
  return R"JSON({
  "$schema": "https://json-schema.org/draft/2020-12/schema",
  "title": "Vesper Config",
  "type": "object",
  "additionalProperties": true,
  "properties": {
    "source": {
      "type": "object",
      "properties": {
        "url": {"type": "string", "pattern": "^https?://"},
        "timeout_ms": {"type": "integer", "minimum": 1},
        "user_agent": {"type": "string"}
      }
    },
    "proxy": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "type": {"type": "string", "enum": ["prefix", "domain"]},
        "root": {"type": "string"}
      }
    },
    "render": {
      "type": "object",
      "properties": {
        "width": {"type": "integer", "minimum": 20},
        "color": {"type": "boolean"}
      }
    },
    "tracker": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "path": {"type": "string"}
      }
    },
    "observability": {
      "type": "object",
      "properties": {
        "backend": {"type": "string", "enum": ["log", "none"]},
        "level": {"type": "string", "enum": ["debug", "info", "warn", "error"]}
      }
    }
  }
})JSON";
}

} // namespace vesper::config
