/*
 * tag_scanner_gumbo.cpp
 *
 * ITagScanner backed by Google's Gumbo HTML5 parser.
 * - Gumbo recovers from any tag soup, so the only hard failures are inputs that are not
 *   text markup at all (empty, whitespace-only, embedded NUL bytes) or a parser failure.
 * - Elements are visited in document order (pre-order DFS), attributes in source order.
 */

#include <orderpix/downloader/downloader.hpp>

#include <gumbo.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <vector>

namespace orderpix::downloader {

namespace {

constexpr std::array<std::string_view, 3> kLocationAttributes = {"href", "src", "data-src"};

bool isLocationAttribute(std::string_view name) {
    return std::find(kLocationAttributes.begin(), kLocationAttributes.end(), name) !=
           kLocationAttributes.end();
}

struct GumboOutputDeleter {
    void operator()(GumboOutput* out) const noexcept {
        gumbo_destroy_output(&kGumboDefaultOptions, out);
    }
};

} // namespace

class GumboTagScanner final : public ITagScanner {
public:
    Expected<void> scan(std::string_view html, const TagAttributeVisitor& visit) const override {
        const bool blank = std::all_of(html.begin(), html.end(), [](unsigned char c) {
            return std::isspace(c) != 0;
        });
        if (blank) {
            return Error{ErrorCode::ParseError, "Listing page is empty"};
        }
        if (html.find('\0') != std::string_view::npos) {
            return Error{ErrorCode::ParseError, "Listing page contains binary data"};
        }

        std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
            gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
        if (!output || !output->root) {
            return Error{ErrorCode::ParseError, "HTML parser returned no document"};
        }

        std::size_t reported = 0;
        std::vector<const GumboNode*> stack;
        stack.push_back(output->root);
        while (!stack.empty()) {
            const GumboNode* node = stack.back();
            stack.pop_back();
            if (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_TEMPLATE)
                continue;

            const GumboElement& element = node->v.element;
            const char* tagName = gumbo_normalized_tagname(element.tag);
            if (tagName != nullptr && *tagName != '\0') {
                for (unsigned int i = 0; i < element.attributes.length; ++i) {
                    const auto* attr = static_cast<const GumboAttribute*>(element.attributes.data[i]);
                    if (attr == nullptr || attr->name == nullptr || attr->value == nullptr)
                        continue;
                    if (!isLocationAttribute(attr->name))
                        continue;
                    if (visit) {
                        visit(TagAttribute{tagName, attr->name, attr->value});
                    }
                    ++reported;
                }
            }

            // Push children in reverse so they pop in document order
            const GumboVector& children = element.children;
            for (unsigned int i = children.length; i > 0; --i) {
                stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
            }
        }

        spdlog::debug("Tag scan found {} location attributes in {} bytes", reported, html.size());
        return Expected<void>{};
    }
};

std::unique_ptr<ITagScanner> makeGumboTagScanner() {
    return std::make_unique<GumboTagScanner>();
}

} // namespace orderpix::downloader
