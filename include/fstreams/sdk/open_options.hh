/**
 * @file open_options.hh
 * @brief Named extra arguments forwarded to handler constructors
 * @ingroup sdk
 */

#pragma once

#include <fstreams/error.hh>
#include <fstreams/export_fstreams.h>
#include <any>
#include <typeinfo>
#include <map>
#include <string>
#include <utility>

namespace fstreams {

    /**
     * @class open_options
     * @brief Bag of named, typed values for a handler constructor
     *
     * The resolver does not interpret options; it passes them to the
     * constructor chosen for the format. Each handler documents the options
     * it understands.
     *
     * @code
     * open_options opts;
     * opts.set("precision", 1000.0f).set("atoms", std::size_t{304});
     * auto s = open_stream<frame>("run.xtc", opts);
     * @endcode
     */
    class FSTREAMS_EXPORT open_options {
        public:
            template<typename T>
            open_options& set(const std::string& name, T value) {
                m_values[name] = std::move(value);
                return *this;
            }

            [[nodiscard]] bool contains(const std::string& name) const;

            /**
             * @brief Value of option @p name
             * @throws option_error if missing or not of type T
             */
            template<typename T>
            [[nodiscard]] T get(const std::string& name) const {
                auto it = m_values.find(name);
                if (it == m_values.end()) {
                    throw option_error("missing option '" + name + "'");
                }
                return cast<T>(name, it->second);
            }

            /**
             * @brief Value of option @p name, or @p fallback if missing
             * @throws option_error if present but not of type T
             */
            template<typename T>
            [[nodiscard]] T get_or(const std::string& name, T fallback) const {
                auto it = m_values.find(name);
                if (it == m_values.end()) {
                    return fallback;
                }
                return cast<T>(name, it->second);
            }

            [[nodiscard]] bool empty() const;
            [[nodiscard]] size_t size() const;

        private:
            template<typename T>
            static T cast(const std::string& name, const std::any& value) {
                if (const auto* v = std::any_cast<T>(&value)) {
                    return *v;
                }
                throw option_error("option '" + name + "' holds a " + value.type().name()
                                   + ", not a " + typeid(T).name());
            }

            std::map<std::string, std::any> m_values;
    };

} // namespace fstreams
