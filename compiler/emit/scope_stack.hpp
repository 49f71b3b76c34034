#pragma once

#include "../ir/internal_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::emit
{
    struct ClosureHandle
    {
        std::uint32_t id{0};
        std::string targetName;
    };

    // Writes the target-language syntax that captures a component's child content.
    class ClosureWriter
    {
    public:
        virtual ~ClosureWriter() = default;

        // Begin capturing; code written until the matching end targets innerTarget.
        virtual ClosureHandle beginChildContent(std::string_view outerTarget, std::string_view innerTarget) = 0;
        virtual void endChildContent(const ClosureHandle& handle) = 0;
    };

    struct ScopeFrame
    {
        std::string tagName;
        bool isComponent{false};
        std::uint32_t childCount{0};
        std::optional<ClosureHandle> activeClosure;
    };

    /**
     * Tracks element and component nesting while the emitter walks the tree.
     * The first child written into a component opens a child-content closure, which
     * gets a fresh emission target so nested closures never share a name.
     * Unbalanced use is an internal error: the offending call returns false and the
     * error is kept in errors().
     */
    class ScopeStack
    {
    public:
        explicit ScopeStack(std::string targetPrefix = "builder");

        bool openScope(std::string_view tagName, bool isComponent);
        bool incrementChildCount(ClosureWriter& writer);
        bool closeScope(ClosureWriter& writer);
        bool finish();

        [[nodiscard]] const std::string& targetName() const noexcept;
        [[nodiscard]] std::size_t depth() const noexcept;
        [[nodiscard]] const ScopeFrame* current() const noexcept;
        [[nodiscard]] const std::vector<ir::InternalError>& errors() const noexcept;

    private:
        void offsetTargetNumber(int delta);
        bool rejectAfterFinish(std::string_view operation);
        void reportError(std::string_view code, std::string detail);

    private:
        std::vector<ScopeFrame> m_frames;
        std::string m_prefix;
        int m_targetNumber{1};
        std::string m_targetName;
        bool m_finished{false};
        std::vector<ir::InternalError> m_errors;
    };
} // namespace stencil::emit
