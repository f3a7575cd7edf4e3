#include "core/FeedParser.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <optional>
#include <regex>
#include <sstream>
#include <pugixml.hpp>

namespace showgrab {
namespace core {

const char* const FeedParser::kUnparsableDescription = "Could not parse description.";

namespace {

const char* const kDefaultTitle = "No Title";
const char* const kDefaultPubDate = "No Date";

std::string trim(const std::string& value) {
    const char* whitespace = " \t\n\r\f\v";
    auto first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    auto last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

bool equalsIgnoreCase(const char* lhs, const char* rhs) {
    while (*lhs && *rhs) {
        if (std::tolower(static_cast<unsigned char>(*lhs)) != std::tolower(static_cast<unsigned char>(*rhs))) {
            return false;
        }
        ++lhs;
        ++rhs;
    }
    return *lhs == *rhs;
}

// Concatenated character data directly under a node (pcdata and cdata alike)
std::string nodeText(const pugi::xml_node& node) {
    std::string text;
    for (auto child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            text += child.value();
        }
    }
    return text;
}

// Text content of a node and all of its descendants, in document order
void appendTextContent(const pugi::xml_node& node, std::string& out) {
    for (auto child : node.children()) {
        if (child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) {
            out += child.value();
        } else if (child.type() == pugi::node_element) {
            appendTextContent(child, out);
        }
    }
}

// Named HTML entities seen in feed descriptions; the XML ones are left for pugixml
const struct {
    const char* name;
    const char* utf8;
} kHtmlEntities[] = {
    {"nbsp", " "},
    {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
    {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"},
    {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
    {"hellip", "\xE2\x80\xA6"}, {"bull", "\xE2\x80\xA2"},
    {"middot", "\xC2\xB7"}, {"laquo", "\xC2\xAB"}, {"raquo", "\xC2\xBB"},
    {"copy", "\xC2\xA9"}, {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"},
    {"deg", "\xC2\xB0"}, {"times", "\xC3\x97"},
    {"aacute", "\xC3\xA1"}, {"eacute", "\xC3\xA9"}, {"egrave", "\xC3\xA8"},
    {"auml", "\xC3\xA4"}, {"ouml", "\xC3\xB6"}, {"uuml", "\xC3\xBC"},
    {"ccedil", "\xC3\xA7"}, {"ntilde", "\xC3\xB1"}
};

std::string decodeHtmlEntities(const std::string& html) {
    std::string decoded;
    decoded.reserve(html.size());

    std::string::size_type pos = 0;
    while (pos < html.size()) {
        auto amp = html.find('&', pos);
        if (amp == std::string::npos) {
            decoded.append(html, pos, std::string::npos);
            break;
        }
        decoded.append(html, pos, amp - pos);

        const char* replacement = nullptr;
        auto semi = html.find(';', amp + 1);
        if (semi != std::string::npos && semi - amp - 1 <= 8) {
            std::string name = html.substr(amp + 1, semi - amp - 1);
            for (const auto& entity : kHtmlEntities) {
                if (name == entity.name) {
                    replacement = entity.utf8;
                    break;
                }
            }
        }

        if (replacement) {
            decoded += replacement;
            pos = semi + 1;
        } else {
            decoded += '&';
            pos = amp + 1;
        }
    }
    return decoded;
}

// HTML void elements are rarely self-closed in feed descriptions
std::string normalizeHtmlFragment(const std::string& html) {
    static const std::regex voidElement(
        R"(<(br|hr|img|meta|link|input|wbr|source|embed|col|area|param)\b([^<>]*?)\s*/?>)",
        std::regex::ECMAScript | std::regex::icase);
    return decodeHtmlEntities(std::regex_replace(html, voidElement, "<$1$2/>"));
}

// Text of the first paragraph of markup that is not well-formed (unclosed or
// crossed tags). The paragraph runs to the next <p> or </p>. Empty if there is
// no paragraph, nullopt if its text still cannot be read.
std::optional<std::string> recoverFirstParagraph(const std::string& html) {
    static const std::regex paragraphTag(R"(<(/?)p\b[^<>]*>)",
                                         std::regex::ECMAScript | std::regex::icase);
    static const std::regex anyTag(R"(<[^<>]*>)");

    std::sregex_iterator it(html.begin(), html.end(), paragraphTag);
    std::sregex_iterator end;
    while (it != end && (*it)[1].length() != 0) {
        ++it;
    }
    if (it == end) {
        return std::string();
    }

    auto contentBegin = (*it)[0].second;
    auto contentEnd = html.end();
    std::smatch next;
    if (std::regex_search(contentBegin, html.end(), next, paragraphTag)) {
        contentEnd = next[0].first;
    }

    std::string text = std::regex_replace(std::string(contentBegin, contentEnd), anyTag, "");
    std::string wrapped = "<p>" + text + "</p>";

    pugi::xml_document paragraph;
    if (!paragraph.load_buffer(wrapped.data(), wrapped.size(), pugi::parse_default | pugi::parse_fragment)) {
        return std::nullopt;
    }
    std::string content;
    appendTextContent(paragraph.first_child(), content);
    return trim(content);
}

// Offset of an RFC 822 zone from UTC, in seconds
long zoneOffsetSeconds(const std::string& zone) {
    if (zone.size() == 5 && (zone[0] == '+' || zone[0] == '-') &&
        std::all_of(zone.begin() + 1, zone.end(), [](unsigned char c) { return std::isdigit(c); })) {
        long hours = (zone[1] - '0') * 10 + (zone[2] - '0');
        long minutes = (zone[3] - '0') * 10 + (zone[4] - '0');
        long offset = hours * 3600 + minutes * 60;
        return zone[0] == '-' ? -offset : offset;
    }

    static const struct {
        const char* name;
        long hours;
    } namedZones[] = {
        {"GMT", 0}, {"UT", 0}, {"UTC", 0}, {"Z", 0},
        {"EST", -5}, {"EDT", -4}, {"CST", -6}, {"CDT", -5},
        {"MST", -7}, {"MDT", -6}, {"PST", -8}, {"PDT", -7}
    };
    for (const auto& named : namedZones) {
        if (equalsIgnoreCase(zone.c_str(), named.name)) {
            return named.hours * 3600;
        }
    }
    return 0;
}

} // namespace

void FeedParser::loadDocument(pugi::xml_document& doc, const std::string& xml) const {
    if (trim(xml).empty()) {
        throw ParseError("Failed to parse XML feed: empty document");
    }

    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw ParseError("Failed to parse XML feed: " + std::string(result.description()) +
                         " at offset " + std::to_string(result.offset));
    }

    if (!doc.document_element()) {
        throw ParseError("Invalid feed format: no root element found");
    }
}

std::vector<ShowRecord> FeedParser::parse(const std::string& xml) const {
    pugi::xml_document doc;
    loadDocument(doc, xml);

    // Items may sit under rss/channel (RSS 2.0) or beside the channel (RSS 1.0)
    pugi::xpath_node_set items = doc.select_nodes("//item");
    items.sort();

    std::vector<ShowRecord> shows;
    shows.reserve(items.size());
    for (const pugi::xpath_node& item : items) {
        shows.push_back(parseItem(item.node()));
    }
    return shows;
}

std::string FeedParser::parseChannelTitle(const std::string& xml) const {
    pugi::xml_document doc;
    loadDocument(doc, xml);

    pugi::xml_node channel = doc.child("rss").child("channel");
    if (!channel) {
        channel = doc.child("rdf:RDF").child("channel");
    }
    if (!channel) {
        channel = doc.child("feed"); // Atom
    }
    if (!channel) {
        return "";
    }
    return trim(nodeText(channel.child("title")));
}

ShowRecord FeedParser::parseItem(const pugi::xml_node& item) const {
    ShowRecord show;

    show.title = trim(nodeText(item.child("title")));
    if (show.title.empty()) {
        show.title = kDefaultTitle;
    }

    std::string descriptionHtml = nodeText(item.child("description"));
    if (!trim(descriptionHtml).empty()) {
        show.description = extractFirstParagraph(descriptionHtml);
    }

    if (auto enclosure = item.child("enclosure")) {
        show.link = trim(enclosure.attribute("url").value());
        show.lengthBytes = parseLength(enclosure.attribute("length").value());
    }

    show.publishedRaw = trim(nodeText(item.child("pubDate")));
    if (show.publishedRaw.empty()) {
        show.publishedRaw = kDefaultPubDate;
        show.publishedTimestamp = 0;
    } else {
        show.publishedTimestamp = parsePubDate(show.publishedRaw);
    }

    return show;
}

std::string FeedParser::extractFirstParagraph(const std::string& html) {
    std::string normalized = normalizeHtmlFragment(html);

    pugi::xml_document fragment;
    pugi::xml_parse_result result = fragment.load_buffer(
        normalized.data(), normalized.size(), pugi::parse_default | pugi::parse_fragment);
    if (!result) {
        std::optional<std::string> recovered = recoverFirstParagraph(normalized);
        return recovered ? *recovered : kUnparsableDescription;
    }

    pugi::xml_node paragraph = fragment.find_node([](pugi::xml_node node) {
        return node.type() == pugi::node_element && equalsIgnoreCase(node.name(), "p");
    });
    if (!paragraph) {
        return "";
    }

    std::string text;
    appendTextContent(paragraph, text);
    return trim(text);
}

std::uint64_t FeedParser::parseLength(const std::string& value) {
    std::string digits = trim(value);
    if (!digits.empty() && digits[0] == '+') {
        digits.erase(0, 1);
    }
    if (digits.empty()) {
        return 0;
    }

    std::uint64_t length = 0;
    const char* begin = digits.data();
    const char* end = digits.data() + digits.size();
    std::from_chars_result result = std::from_chars(begin, end, length);
    if (result.ec != std::errc() || result.ptr != end) {
        return 0;
    }
    return length;
}

std::int64_t FeedParser::parsePubDate(const std::string& raw) {
    std::string value = trim(raw);

    // Day of week is optional
    auto comma = value.find(',');
    if (comma != std::string::npos) {
        value = trim(value.substr(comma + 1));
    }
    if (value.empty()) {
        return 0;
    }

    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%d %b %Y %H:%M");
    if (in.fail()) {
        return 0;
    }

    if (in.peek() == ':') {
        in.get();
        int seconds = 0;
        in >> seconds;
        if (in.fail() || seconds < 0 || seconds > 60) {
            return 0;
        }
        tm.tm_sec = seconds;
    }

    std::string zone;
    in >> zone;

    time_t utc = timegm(&tm);
    if (utc == static_cast<time_t>(-1)) {
        return 0;
    }
    return static_cast<std::int64_t>(utc) - zoneOffsetSeconds(zone);
}

} // namespace core
} // namespace showgrab
