// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace molxr::ui
{

    class Command
    {
    public:
        virtual ~Command() = default;
        virtual void execute() = 0;
    };

    // Adapts any callable to a Command
    class FunctionCommand : public Command
    {
    public:
        explicit FunctionCommand(std::function<void()> fn) : m_fn(std::move(fn)) {}

        void execute() override
        {
            if (m_fn)
                m_fn();
        }

    private:
        std::function<void()> m_fn;
    };

    inline std::shared_ptr<Command> make_command(std::function<void()> fn)
    {
        return std::make_shared<FunctionCommand>(std::move(fn));
    }

    struct MenuItem
    {
        std::string label;
        std::shared_ptr<Command> action;
    };

} // namespace molxr::ui
