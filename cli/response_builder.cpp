#include "response_builder.h"

#include <stdexcept>

#include "confq/paginator.h"

namespace confq::cli {

using nlohmann::json;

json build_query_response(const FallbackResult& outcome,
                          const std::string& source,
                          const ResponseOptions& options) {
  std::optional<json> data;
  if (outcome.effective_format == FormatType::Json) {
    json parsed = json::parse(outcome.result.raw_bytes, nullptr, false);
    if (!parsed.is_discarded()) data = std::move(parsed);
  }

  json response = json::object();
  response["success"] = true;
  response["format"] = format_name(outcome.effective_format);
  response["source"] = source;
  if (outcome.fell_back) response["fallback"] = true;

  if (options.summary || options.keys) {
    if (!data.has_value()) {
      throw std::invalid_argument("Structure summaries need JSON output (use --output-format json)");
    }
    if (options.keys) {
      response["keys"] = top_level_keys(*data);
    } else {
      response["summary"] = summarize_structure(*data, options.summary_depth, options.full_keys);
    }
    return response;
  }

  const std::string text = data.has_value() ? canonical_serialization(*data)
                                            : outcome.result.raw_bytes;
  if (!options.cursor_token.has_value() && text.size() <= options.page_size) {
    response["result"] = data.has_value() ? *data : json(text);
    return response;
  }

  std::optional<Cursor> cursor;
  if (options.cursor_token.has_value()) cursor = decode_cursor(*options.cursor_token);
  PageResult page = paginate_text(text, cursor, options.page_size);
  response["result"] = page.chunk_bytes;
  response["paginated"] = true;
  response["total_size"] = page.total_size;
  if (page.next_cursor.has_value()) {
    response["nextCursor"] = encode_cursor(*page.next_cursor);
    std::optional<std::string> hint;
    if (data.has_value()) hint = pagination_hint(*data);
    if (auto advisory = pagination_advisory(page.total_size, options.page_size, hint)) {
      response["advisory"] = *advisory;
    }
  }
  return response;
}

json error_envelope(const std::string& kind, const std::string& message) {
  return json{{"error", {{"kind", kind}, {"message", message}}}};
}

}  // namespace confq::cli
