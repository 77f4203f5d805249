#ifndef SCHEMA_20200812_H
#define SCHEMA_20200812_H

#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace redist {

template <typename Derived> struct SchemaTraits;
template <template <typename> typename Derived, typename T> struct SchemaTraits<Derived<T>> {
    using value_type = T;
};

template <typename Derived> class SchemaCommon {
public:
    using value_type = typename SchemaTraits<Derived>::value_type;
    using validator_fun_t = std::function<bool(value_type const& value)>;

    Derived& help(std::string&& help) {
        help_ = std::move(help);
        return static_cast<Derived&>(*this);
    }

    Derived& validator(validator_fun_t&& validator) {
        validator_ = std::move(validator);
        return static_cast<Derived&>(*this);
    }

    Derived& default_value(value_type&& val) {
        default_ = std::optional<value_type>(std::move(val));
        return static_cast<Derived&>(*this);
    }

    auto const& get_default_value() const { return default_; }
    std::string_view get_help() const { return help_; }

protected:
    value_type validated(value_type&& value) const {
        if (!validator_(value)) {
            throw std::runtime_error("Validator returned false");
        }
        return std::move(value);
    }

    std::string help_;
    validator_fun_t validator_ = [](value_type const&) { return true; };
    std::optional<value_type> default_ = std::nullopt;
};

/**
 * @brief Schema of a scalar: boolean, number, string, or (with converter) anything else
 *
 * A converter maps a string to T and is mandatory for enums.
 */
template <typename T> class ValueSchema : public SchemaCommon<ValueSchema<T>> {
public:
    using converter_fun_t = std::function<T(std::string_view)>;

    template <typename Fun> ValueSchema<T>& converter(Fun&& converter) {
        converter_ = [converter](std::string_view value) { return T(converter(value)); };
        return *this;
    }

    T translate(toml::node_view<const toml::node> node) const {
        if (converter_) {
            auto str = node.value<std::string>();
            if (!str) {
                throw std::runtime_error(conversion_error(node, "<string>"));
            }
            return this->validated(converter_(*str));
        }
        if constexpr (std::is_enum_v<T>) {
            throw std::logic_error("Enum value without converter");
        } else {
            auto result = node.value<T>();
            if (!result) {
                throw std::runtime_error(conversion_error(node, type_name()));
            }
            return this->validated(std::move(*result));
        }
    }

    T translate(std::string_view value) const {
        if (converter_) {
            return this->validated(converter_(value));
        }
        T result{};
        if constexpr (std::is_same_v<bool, T>) {
            std::string data(value);
            std::transform(data.begin(), data.end(), data.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (data == "yes" || data == "true") {
                result = true;
            } else if (data == "no" || data == "false") {
                result = false;
            } else {
                throw std::runtime_error("Could not convert " + data + " to boolean");
            }
        } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
            auto res = std::from_chars(value.data(), value.data() + value.size(), result);
            if (res.ec == std::errc::invalid_argument || res.ptr != value.data() + value.size()) {
                throw std::invalid_argument("Could not convert " + std::string(value) + " to " +
                                            type_name());
            } else if (res.ec == std::errc::result_out_of_range) {
                throw std::out_of_range(std::string(value) + " is out of range");
            }
        } else if constexpr (std::is_same_v<std::string, T>) {
            result = value;
        } else {
            throw std::logic_error("Value without converter");
        }
        return this->validated(std::move(result));
    }

    void print_schema(std::ostream& out) const {
        if (this->default_) {
            if constexpr (std::is_same_v<std::string, T>) {
                out << "\"" << *this->default_ << "\"";
            } else if constexpr (std::is_arithmetic_v<T>) {
                out << *this->default_;
            } else {
                out << type_name();
            }
        } else {
            out << type_name();
        }
    }

private:
    static std::string type_name() {
        if constexpr (std::is_same_v<bool, T>) {
            return "<boolean>";
        } else if constexpr (std::is_integral_v<T>) {
            return "<integer>";
        } else if constexpr (std::is_floating_point_v<T>) {
            return "<float>";
        } else {
            return "<string>";
        }
    }

    static std::string conversion_error(toml::node_view<const toml::node> node,
                                        std::string const& expected) {
        std::stringstream ss;
        ss << "Value " << node << " could not be converted to expected type " << expected;
        return ss.str();
    }

    converter_fun_t converter_;
};

/**
 * @brief Schema of an array of scalars, e.g. std::vector<std::size_t>
 */
template <typename T> class ArraySchema : public SchemaCommon<ArraySchema<T>> {
public:
    using entry_type = typename T::value_type;

    ArraySchema<T>& min(std::size_t m) {
        min_ = m;
        return *this;
    }
    ArraySchema<T>& max(std::size_t m) {
        max_ = m;
        return *this;
    }

    ValueSchema<entry_type>& of_values() { return of_; }

    T translate(toml::node_view<const toml::node> node) const {
        toml::array const* raw = node.as_array();
        if (!raw) {
            throw std::runtime_error("Expected array");
        }
        if (raw->size() < min_ || raw->size() > max_) {
            std::stringstream ss;
            ss << "Given array size is n = " << raw->size() << "; should be " << min_
               << " <= n <= " << max_;
            throw std::runtime_error(ss.str());
        }
        T array;
        array.reserve(raw->size());
        for (std::size_t idx = 0; idx < raw->size(); ++idx) {
            try {
                array.emplace_back(of_.translate(node[idx]));
            } catch (std::exception const& e) {
                std::stringstream ss;
                ss << e.what() << std::endl << "  --> entry " << idx;
                throw std::runtime_error(ss.str());
            }
        }
        return this->validated(std::move(array));
    }

    T translate(std::string_view) const {
        throw std::logic_error("Arrays cannot be given on the command line");
    }

    void print_schema(std::ostream& out) const {
        out << "[";
        if (min_ == max_) {
            out << min_;
        } else if (max_ == std::numeric_limits<std::size_t>::max()) {
            out << min_ << "--n";
        } else {
            out << min_ << "--" << max_;
        }
        out << " x ";
        of_.print_schema(out);
        out << "]";
    }

private:
    ValueSchema<entry_type> of_;
    std::size_t min_ = 0;
    std::size_t max_ = std::numeric_limits<std::size_t>::max();
};

/**
 * @brief Maps the keys of a TOML table to the members of T
 *
 * Members of type std::optional<U> may be absent; other members need a value or a default.
 */
template <typename T> class TableSchema {
public:
    template <typename U> auto& add_value(std::string&& name, U T::*member) {
        return add<U, ValueSchema>(std::move(name), member);
    }

    template <typename U> auto& add_array(std::string&& name, U T::*member) {
        return add<U, ArraySchema>(std::move(name), member);
    }

    T translate(toml::node_view<const toml::node> node) const {
        T table{};
        for (auto&& [key, model] : entries_) {
            try {
                model->translate(table, node[key]);
            } catch (std::exception const& e) {
                throw std::runtime_error(format_error(e, key, *model));
            }
        }
        return table;
    }

    T translate(toml::table const& table) const {
        return translate(toml::node_view<const toml::node>(&table));
    }

    /**
     * @brief Overrides the member stored under key by a command line value
     */
    void set(T& table, std::string_view key, std::string_view value) const {
        for (auto&& [k, model] : entries_) {
            if (key == k) {
                try {
                    model->translate(table, value);
                } catch (std::exception const& e) {
                    throw std::runtime_error(format_error(e, key, *model));
                }
                return;
            }
        }
        throw std::runtime_error("Unknown key " + std::string(key));
    }

    void print_schema(std::ostream& out) const {
        for (auto&& [key, model] : entries_) {
            out << key << " = ";
            model->print_schema(out);
            auto help = model->get_help();
            if (!help.empty()) {
                out << " # " << help;
            }
            out << std::endl;
        }
    }

    /**
     * @brief Calls callback(key, help) for every scalar entry
     */
    void cmd_line_args(std::function<void(std::string_view, std::string_view)> callback) const {
        for (auto&& [key, model] : entries_) {
            if (model->is_scalar()) {
                callback(key, model->get_help());
            }
        }
    }

private:
    class Concept {
    public:
        virtual ~Concept() {}
        virtual void translate(T& table, toml::node_view<const toml::node> node) const = 0;
        virtual void translate(T& table, std::string_view value) const = 0;
        virtual void print_schema(std::ostream& out) const = 0;
        virtual std::string_view get_help() const = 0;
        virtual bool is_scalar() const = 0;
    };

    template <typename U, template <typename> typename S> class ModelCommon : public Concept {
    public:
        void print_schema(std::ostream& out) const override { schema_.print_schema(out); }
        std::string_view get_help() const override { return schema_.get_help(); }
        bool is_scalar() const override { return std::is_same_v<S<U>, ValueSchema<U>>; }
        S<U>& schema() { return schema_; }

    protected:
        S<U> schema_;
    };

    template <typename U, template <typename> typename S> class Model : public ModelCommon<U, S> {
    public:
        Model(U T::*member) : member_(member) {}
        void translate(T& table, toml::node_view<const toml::node> node) const override {
            if (!node) {
                if (!this->schema_.get_default_value()) {
                    throw std::runtime_error(
                        "Value missing although non-optional and no default is provided");
                }
                table.*member_ = *this->schema_.get_default_value();
                return;
            }
            table.*member_ = this->schema_.translate(node);
        }
        void translate(T& table, std::string_view value) const override {
            table.*member_ = this->schema_.translate(value);
        }

    private:
        U T::*member_;
    };

    template <typename U, template <typename> typename S>
    class Model<std::optional<U>, S> : public ModelCommon<U, S> {
    public:
        Model(std::optional<U> T::*member) : member_(member) {}
        void translate(T& table, toml::node_view<const toml::node> node) const override {
            if (node) {
                table.*member_ = std::make_optional(this->schema_.translate(node));
            } else if (this->schema_.get_default_value()) {
                table.*member_ = this->schema_.get_default_value();
            }
        }
        void translate(T& table, std::string_view value) const override {
            table.*member_ = std::make_optional(this->schema_.translate(value));
        }

    private:
        std::optional<U> T::*member_;
    };

    template <typename U, template <typename> typename S>
    auto& add(std::string&& name, U T::*member) {
        auto entry = std::make_unique<Model<U, S>>(member);
        auto& schema = entry->schema();
        entries_.emplace_back(std::make_pair(std::move(name), std::move(entry)));
        return schema;
    }

    static std::string format_error(std::exception const& e, std::string_view key,
                                    Concept const& model) {
        std::stringstream ss;
        ss << e.what() << std::endl;
        ss << "  --> " << key;
        auto help = model.get_help();
        if (!help.empty()) {
            ss << " (\"" << help << "\")";
        }
        return ss.str();
    }

    std::vector<std::pair<std::string, std::unique_ptr<Concept>>> entries_;
};

} // namespace redist

template <typename T>
std::ostream& operator<<(std::ostream& lhs, redist::TableSchema<T> const& rhs) {
    rhs.print_schema(lhs);
    return lhs;
}

#endif // SCHEMA_20200812_H
