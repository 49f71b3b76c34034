#include "scope_stack.hpp"

#include <utility>

namespace stencil::emit
{
    ScopeStack::ScopeStack(std::string targetPrefix)
        : m_prefix(std::move(targetPrefix))
        , m_targetName(m_prefix)
    {
    }

    bool ScopeStack::openScope(std::string_view tagName, bool isComponent)
    {
        if (rejectAfterFinish("openScope"))
        {
            return false;
        }

        ScopeFrame frame;
        frame.tagName = std::string{tagName};
        frame.isComponent = isComponent;
        m_frames.emplace_back(std::move(frame));
        return true;
    }

    bool ScopeStack::incrementChildCount(ClosureWriter& writer)
    {
        if (rejectAfterFinish("incrementChildCount"))
        {
            return false;
        }

        // Top-level content has no enclosing scope to count against.
        if (m_frames.empty())
        {
            return true;
        }

        ScopeFrame& frame = m_frames.back();
        if (frame.isComponent && frame.childCount == 0)
        {
            const std::string outerTarget = m_targetName;
            offsetTargetNumber(1);
            frame.activeClosure = writer.beginChildContent(outerTarget, m_targetName);
        }

        ++frame.childCount;
        return true;
    }

    bool ScopeStack::closeScope(ClosureWriter& writer)
    {
        if (rejectAfterFinish("closeScope"))
        {
            return false;
        }

        if (m_frames.empty())
        {
            reportError("STENCIL-I5201", "closeScope called with no open scope.");
            return false;
        }

        ScopeFrame frame = std::move(m_frames.back());
        m_frames.pop_back();

        if (frame.activeClosure.has_value())
        {
            writer.endChildContent(*frame.activeClosure);
            frame.activeClosure.reset();
            offsetTargetNumber(-1);
        }

        return true;
    }

    bool ScopeStack::finish()
    {
        if (rejectAfterFinish("finish"))
        {
            return false;
        }

        m_finished = true;
        if (!m_frames.empty())
        {
            reportError("STENCIL-I5202",
                        "emission finished with " + std::to_string(m_frames.size()) + " open scope(s), innermost '"
                            + m_frames.back().tagName + "'.");
            return false;
        }

        return true;
    }

    const std::string& ScopeStack::targetName() const noexcept
    {
        return m_targetName;
    }

    std::size_t ScopeStack::depth() const noexcept
    {
        return m_frames.size();
    }

    const ScopeFrame* ScopeStack::current() const noexcept
    {
        return m_frames.empty() ? nullptr : &m_frames.back();
    }

    const std::vector<ir::InternalError>& ScopeStack::errors() const noexcept
    {
        return m_errors;
    }

    void ScopeStack::offsetTargetNumber(int delta)
    {
        m_targetNumber += delta;
        m_targetName = m_targetNumber == 1 ? m_prefix : m_prefix + std::to_string(m_targetNumber);
    }

    bool ScopeStack::rejectAfterFinish(std::string_view operation)
    {
        if (!m_finished)
        {
            return false;
        }

        reportError("STENCIL-I5203", std::string{operation} + " called after emission finished.");
        return true;
    }

    void ScopeStack::reportError(std::string_view code, std::string detail)
    {
        ir::InternalError error;
        error.code = std::string{code};
        error.stage = "scope-stack";
        error.detail = std::move(detail);
        m_errors.emplace_back(std::move(error));
    }
} // namespace stencil::emit
