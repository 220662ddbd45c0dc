/// @file raii.hpp
/// @brief RAII scoped wrappers for the ImGui Begin/End and Push/Pop pairs the ring widget uses.
///
/// End/Pop runs in the destructor, even on early return.
/// Scopes that track a bool (window) convert to bool for if-blocks.
///
/// Usage:
/// @code
///   if (unified_ring::window w{"Ring", &open}) { ... }
///   { unified_ring::id scope{"ring"}; ... }
///   { unified_ring::style_color sc{ImGuiCol_Text, colors::accent}; ... }
/// @endcode
#pragma once

#include <imgui.h>
#include <type_traits>
#include <utility>
#include <variant>

namespace unified_ring {

    /**
     * @brief Determines when the end/pop function is called.
     *
     * - always: end() unconditionally (Window, Group).
     * - none:   always pop, no bool tracking (PushID, PushStyleColor).
     */
    enum class end_policy { always, none };

    /**
     * @brief Calls Trait::begin() on construction and Trait::end() on destruction.
     * @tparam Trait A type providing static begin(), end() and policy.
     */
    template<typename Trait>
    class [[nodiscard]] raii_scope {
        static constexpr bool has_state = Trait::policy != end_policy::none;

        [[no_unique_address]] std::conditional_t<has_state, bool, std::monostate> state_{};

    public:
        template<typename... Args>
            requires requires { Trait::begin(std::declval<Args>()...); }
        explicit raii_scope(Args &&...args) noexcept {
            if constexpr (has_state) {
                state_ = Trait::begin(std::forward<Args>(args)...);
            } else {
                Trait::begin(std::forward<Args>(args)...);
            }
        }

        ~raii_scope() { Trait::end(); }

        raii_scope(const raii_scope &)            = delete;
        raii_scope &operator=(const raii_scope &) = delete;
        raii_scope(raii_scope &&)                 = delete;
        raii_scope &operator=(raii_scope &&)      = delete;

        [[nodiscard]] explicit operator bool() const noexcept
            requires has_state
        {
            return state_;
        }
    };

    struct window_trait {
        static constexpr auto policy = end_policy::always;
        static bool begin(const char *name, bool *open = nullptr, const ImGuiWindowFlags flags = 0) noexcept {
            return ImGui::Begin(name, open, flags);
        }
        static void end() noexcept { ImGui::End(); }
    };

    struct id_trait {
        static constexpr auto policy = end_policy::none;
        static void begin(const char *str_id) noexcept { ImGui::PushID(str_id); }
        static void begin(const int int_id) noexcept { ImGui::PushID(int_id); }
        static void begin(const void *ptr_id) noexcept { ImGui::PushID(ptr_id); }
        static void end() noexcept { ImGui::PopID(); }
    };

    struct style_color_trait {
        static constexpr auto policy = end_policy::none;
        static void begin(const ImGuiCol idx, const ImVec4 &col) noexcept { ImGui::PushStyleColor(idx, col); }
        static void end() noexcept { ImGui::PopStyleColor(); }
    };

    using window      = raii_scope<window_trait>;
    using id          = raii_scope<id_trait>;
    using style_color = raii_scope<style_color_trait>;

} // namespace unified_ring
