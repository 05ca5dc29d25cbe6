#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "nowiki/util/assert.hpp"
#include "nowiki/util/result.hpp"
#include "nowiki/util/severity.hpp"
#include "nowiki/util/strings.hpp"
#include "nowiki/util/typo.hpp"

#include "nowiki/diagnostic.hpp"
#include "nowiki/directive.hpp"
#include "nowiki/document.hpp"
#include "nowiki/expansion.hpp"
#include "nowiki/format.hpp"
#include "nowiki/highlight.hpp"
#include "nowiki/memory_resources.hpp"
#include "nowiki/print.hpp"
#include "nowiki/services.hpp"
#include "nowiki/sub_parsers.hpp"
#include "nowiki/table.hpp"

namespace nowiki {

namespace {

constexpr std::u8string_view arguments_placeholder = u8"{arguments}";

/// @brief Expands a single `nowiki` node.
struct Nowiki_Expander {
private:
    const Expansion_Options& m_options;
    const Nowiki_View& m_view;
    std::pmr::memory_resource* m_node_memory;
    Pmr_Vector<Document_Node> m_content;

public:
    [[nodiscard]]
    Nowiki_Expander(
        const Expansion_Options& options,
        const Nowiki_View& view,
        std::pmr::memory_resource* node_memory
    )
        : m_options { options }
        , m_view { view }
        , m_node_memory { node_memory }
        , m_content { node_memory }
    {
    }

    /// @brief Releases the content produced by `operator()`.
    [[nodiscard]]
    Pmr_Vector<Document_Node> take_content() &&
    {
        return std::move(m_content);
    }

    [[nodiscard]]
    Result<void, Expansion_Error> operator()(const Highlight_Spec& spec)
    {
        std::optional<Lexer> lexer = find_lexer(m_options.highlighter, spec.language);
        if (!lexer) {
            report_unknown_language(spec.language);
            lexer = plain_text_lexer;
        }

        Highlight_Result result
            = highlight_block(m_view.body, *lexer, m_options.highlighter, m_node_memory);
        if (!result.status) {
            warn_highlight_failure(lexer->language, result.status.error());
        }
        m_content.push_back(std::move(result.block));
        return {};
    }

    [[nodiscard]]
    Result<void, Expansion_Error> operator()(const Table_Spec& spec)
    {
        m_content.push_back(build_csv_table(m_view.body, spec.separator, m_node_memory));
        return {};
    }

    [[nodiscard]]
    Result<void, Expansion_Error> operator()(const Sub_Parser_Spec& spec)
    {
        Result<Document_Node, Sub_Parser_Error> page = invoke_sub_parser(
            m_options.parsers, spec.parser, m_view.body, spec.arguments, m_node_memory
        );
        if (page) {
            m_content.push_back(std::move(*page));
            return {};
        }

        const std::u8string_view parser_name = sub_parser_id_name(spec.parser);
        if (page.error() == Sub_Parser_Error::unavailable) {
            Pmr_U8string message { m_options.memory };
            message += u8"No parser for the format \"";
            message += parser_name;
            message += u8"\" is available.";
            report_invalid_arguments(diagnostic::parser_unavailable, message);
            append_plain_text();
            return {};
        }

        if (m_options.logger.can_log(Severity::error)) {
            Pmr_U8string message { m_options.memory };
            message += u8"The ";
            message += parser_name;
            message += u8" parser failed (";
            message += sub_parser_error_name(page.error());
            message += u8").";
            m_options.logger.log({ Severity::error, diagnostic::parser_failed, message });
        }
        return Expansion_Error::sub_parser_failed;
    }

    [[nodiscard]]
    Result<void, Expansion_Error> operator()(const Unknown_Format_Spec&)
    {
        Pmr_U8string message { m_options.memory };
        message += u8"Unknown format in the directive line \"";
        message += m_view.directive_line;
        message += u8"\".";
        report_invalid_arguments(diagnostic::format_unknown, message);
        append_plain_text();
        return {};
    }

private:
    void append_plain_text()
    {
        Highlight_Result result
            = highlight_block(m_view.body, plain_text_lexer, m_options.highlighter, m_node_memory);
        NOWIKI_DEBUG_ASSERT(result.status);
        m_content.push_back(std::move(result.block));
    }

    /// @brief Inserts an error block and logs a warning with the given `id` and `message`.
    void report_invalid_arguments(std::u8string_view id, std::u8string_view message)
    {
        Pmr_U8string block_message { m_options.memory };
        append_invalid_arguments_message(
            block_message, m_options.invalid_arguments_template, m_view.directive_line
        );
        m_content.push_back(make_error_block(block_message, m_node_memory));
        m_options.logger.log({ Severity::warning, id, message });
    }

    void report_unknown_language(std::u8string_view language)
    {
        Pmr_U8string message { m_options.memory };
        if (language.empty()) {
            message += u8"No language was given for the highlight block.";
        }
        else {
            message += u8"The language \"";
            message += language;
            message += u8"\" is not supported.";

            const Distant<std::u8string_view> match
                = m_options.highlighter.match_supported_language(language, m_options.memory);
            if (match && is_plausible_typo(match.distance, language)) {
                message += u8" Did you mean \"";
                message += match.value;
                message += u8"\"?";
            }
        }
        report_invalid_arguments(diagnostic::highlight_language, message);
    }

    void warn_highlight_failure(std::u8string_view language, Syntax_Highlight_Error error)
    {
        if (!m_options.logger.can_log(Severity::warning)) {
            return;
        }
        Pmr_U8string message { m_options.memory };
        message += u8"Highlighting the code as \"";
        message += language;
        message += u8"\" failed (";
        message += syntax_highlight_error_name(error);
        message += u8"). The code is shown without highlighting.";
        m_options.logger.log({ Severity::warning, diagnostic::highlight_error, message });
    }
};

[[nodiscard]]
Result<void, Expansion_Error> expand_nowiki(Document_Node& node, const Expansion_Options& options)
{
    NOWIKI_DEBUG_ASSERT(node.get_tag() == Node_Tag::nowiki);

    std::optional<Nowiki_View> view = view_nowiki(node);
    if (!view) {
        if (options.logger.can_log(Severity::error)) {
            Pmr_U8string message { u8"Encountered a malformed nowiki node:\n", options.memory };
            print_document(message, node);
            options.logger.log({ Severity::error, diagnostic::malformed, message });
        }
        return Expansion_Error::malformed_nowiki;
    }
    // Placeholders are not necessarily created by make_nowiki.
    view->directive_line = trim_ascii_blank_right(view->directive_line);

    if (options.logger.can_log(Severity::debug)) {
        Pmr_U8string message { u8"Expanding nowiki block with the directive line \"",
                               options.memory };
        message += view->directive_line;
        message += u8"\".";
        options.logger.log({ Severity::debug, diagnostic::expand, message });
    }

    const Directive directive = parse_directive(view->directive_line);
    const Format_Resolution resolution = resolve_format(directive);

    // The view points into the children of node,
    // so they can only be replaced once expansion is done.
    Nowiki_Expander expander { options, *view, node.get_memory() };
    const Result<void, Expansion_Error> result = std::visit(expander, resolution);
    if (!result) {
        return result;
    }

    node.replace_children(std::move(expander).take_content());
    node.set_tag(Node_Tag::expansion);
    return {};
}

struct Pending_Node {
    Document_Node* node;
    /// @brief The number of expanded nowiki blocks enclosing the node.
    std::size_t depth;
};

} // namespace

void append_invalid_arguments_message(
    Pmr_U8string& out,
    std::u8string_view message_template,
    std::u8string_view arguments
)
{
    while (true) {
        const std::size_t index = message_template.find(arguments_placeholder);
        if (index == std::u8string_view::npos) {
            out += message_template;
            return;
        }
        out += message_template.substr(0, index);
        out += arguments;
        message_template.remove_prefix(index + arguments_placeholder.length());
    }
}

Document_Node make_error_block(std::u8string_view message, std::pmr::memory_resource* memory)
{
    Document_Node block { Node_Tag::div, memory };
    block.set_attribute(attribute::class_, error_class);
    block.append(Node_Tag::p).append_text(message);
    return block;
}

Result<void, Expansion_Error> expand(Document_Node& root, const Expansion_Options& options)
{
    std::pmr::vector<Pending_Node> pending { options.memory };
    pending.push_back({ &root, 0 });

    while (!pending.empty()) {
        const Pending_Node current = pending.back();
        pending.pop_back();

        std::size_t child_depth = current.depth;
        if (current.node->get_tag() == Node_Tag::nowiki) {
            if (current.depth > options.max_depth) {
                if (options.logger.can_log(Severity::error)) {
                    Pmr_U8string message { u8"Nowiki blocks are nested too deeply.",
                                           options.memory };
                    options.logger.log({ Severity::error, diagnostic::depth, message });
                }
                return Expansion_Error::depth_exceeded;
            }
            const Result<void, Expansion_Error> result = expand_nowiki(*current.node, options);
            if (!result) {
                return result;
            }
            ++child_depth;
        }

        // Pushing in reverse order means that the leftmost child is processed first.
        // Pointers to children remain valid because the children of a node are only
        // replaced before that node's children are pushed.
        const std::span<Document_Node> children = current.node->get_children();
        for (std::size_t i = children.size(); i-- != 0;) {
            if (!children[i].is_text()) {
                pending.push_back({ &children[i], child_depth });
            }
        }
    }

    return {};
}

} // namespace nowiki
