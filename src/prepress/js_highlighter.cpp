#include "js_highlighter.hpp"

#include "collaborators.hpp"

#include <quickjs.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cassert>

namespace prepress {

[[nodiscard]] static std::string*& get_tl_buffer_ptr() noexcept
{
    thread_local std::string* buffer_ptr{nullptr};
    return buffer_ptr;
}

[[nodiscard]] static std::ostream*& get_tl_err_stream() noexcept
{
    thread_local std::ostream* err_stream{nullptr};
    return err_stream;
}

// ----------------------------------------------------------------------------

template <auto FPtr>
struct tl_guard
{
    using type = std::remove_reference_t<decltype(FPtr())>;
    const type _prev;

    explicit tl_guard(const type& obj) : _prev{std::exchange(FPtr(), obj)}
    {}

    ~tl_guard()
    {
        FPtr() = std::move(_prev);
    }
};

// ----------------------------------------------------------------------------

constexpr auto js_runtime_deleter = [](JSRuntime* ptr)
{
    JS_RunGC(ptr);
    JS_FreeRuntime(ptr);
};

constexpr auto js_context_deleter = [](JSContext* ptr) { JS_FreeContext(ptr); };

using js_runtime_uptr =
    std::unique_ptr<JSRuntime, decltype(js_runtime_deleter)>;

using js_context_uptr =
    std::unique_ptr<JSContext, decltype(js_context_deleter)>;

struct raii_js_value
{
    JSContext* _context;
    JSValue _value;

    explicit raii_js_value(JSContext* context, JSValue&& value) noexcept
        : _context{context}, _value{std::move(value)}
    {}

    raii_js_value(const raii_js_value&) = delete;
    raii_js_value& operator=(const raii_js_value&) = delete;

    raii_js_value(raii_js_value&& rhs)
        : _context{std::exchange(rhs._context, nullptr)},
          _value{std::move(rhs._value)}
    {}

    raii_js_value& operator=(raii_js_value&& rhs)
    {
        if (_context != nullptr)
        {
            JS_FreeValue(_context, _value);
        }

        _context = std::exchange(rhs._context, nullptr);
        _value = std::move(rhs._value);

        return *this;
    }

    ~raii_js_value()
    {
        if (_context != nullptr)
        {
            JS_FreeValue(_context, _value);
        }
    }
};

struct raii_js_cstring
{
    JSContext* _context;
    const char* _str;

    explicit raii_js_cstring(JSContext* context, JSValueConst value) noexcept
        : _context{context}, _str{JS_ToCString(context, value)}
    {}

    raii_js_cstring(const raii_js_cstring&) = delete;
    raii_js_cstring& operator=(const raii_js_cstring&) = delete;

    ~raii_js_cstring()
    {
        if (_str != nullptr)
        {
            JS_FreeCString(_context, _str);
        }
    }

    [[nodiscard]] std::string_view view() const noexcept
    {
        return _str == nullptr ? std::string_view{} : std::string_view{_str};
    }
};

// ----------------------------------------------------------------------------

static raii_js_value eval_impl(
    JSContext* context, const std::string& source) noexcept
{
    // `std::string` guarantees the trailing NUL QuickJS expects.
    return raii_js_value{context, JS_Eval(context, source.c_str(), source.size(),
                                      "<evalScript>", JS_EVAL_TYPE_GLOBAL)};
}

static void output_to_tl_buffer_pointee(JSContext* context, JSValueConst* argv)
{
    const raii_js_value str_value{context, JS_ToString(context, argv[0])};
    const raii_js_cstring string_arg{context, str_value._value};

    std::string* const buffer_ptr{get_tl_buffer_ptr()};
    assert(buffer_ptr != nullptr);
    buffer_ptr->append(string_arg.view());
}

[[nodiscard]] static std::ostream& error_diagnostic_stream(const char* type)
{
    return (*get_tl_err_stream()) << "((" << type << " ERROR)): ";
}

[[nodiscard]] static bool read_file_in_buffer(
    const std::string& path, std::string& buffer)
{
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        error_diagnostic_stream("IO")
            << "Failed to open file '" << path << "'\n\n";

        return false;
    }

    const auto size = static_cast<std::streamsize>(ifs.tellg());
    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(static_cast<std::size_t>(size));

    if (!ifs.read(buffer.data(), size))
    {
        error_diagnostic_stream("IO")
            << "Failed to read file '" << path << "'\n\n";

        return false;
    }

    return true;
}

static void include_file(JSContext* context, JSValueConst* argv)
{
    const raii_js_value str_value{context, JS_ToString(context, argv[0])};
    const raii_js_cstring string_arg{context, str_value._value};

    const std::string path{string_arg.view()};

    thread_local std::string tmp_buffer;

    if (!read_file_in_buffer(path, tmp_buffer))
    {
        return;
    }

    eval_impl(context, tmp_buffer);
}

// ----------------------------------------------------------------------------

struct js_highlighter::impl
{
private:
    tl_guard<&get_tl_err_stream> _err_stream_tl_guard;
    js_runtime_uptr _runtime;
    js_context_uptr _context;
    bool _script_loaded;

    template <auto FPtr>
    void bind_function(const char* name, const int n_args) noexcept
    {
        auto func = [](JSContext* context, JSValueConst this_val, int argc,
                        JSValueConst* argv) -> JSValue
        {
            (void)this_val;

            if (argc < 1)
            {
                return JS_UNDEFINED;
            }

            FPtr(context, argv);
            return JS_UNDEFINED;
        };

        JSContext* ctx = _context.get();

        const raii_js_value global_obj{ctx, JS_GetGlobalObject(ctx)};

        const JSValue js_func = JS_NewCFunction(ctx, +func, name, n_args);

        JS_SetPropertyStr(ctx, global_obj._value, name, js_func);
    }

    void set_global_string(const char* name, const std::string_view value)
    {
        JSContext* ctx = _context.get();

        const raii_js_value global_obj{ctx, JS_GetGlobalObject(ctx)};

        JS_SetPropertyStr(ctx, global_obj._value, name,
            JS_NewStringLen(ctx, value.data(), value.size()));
    }

    void set_global_options(const char* name, const code_options& options)
    {
        JSContext* ctx = _context.get();

        const raii_js_value global_obj{ctx, JS_GetGlobalObject(ctx)};
        const JSValue options_obj = JS_NewObject(ctx);

        for (const code_option& option : options)
        {
            JS_SetPropertyStr(ctx, options_obj, option._name.c_str(),
                JS_NewStringLen(
                    ctx, option._value.data(), option._value.size()));
        }

        JS_SetPropertyStr(ctx, global_obj._value, name, options_obj);
    }

    [[nodiscard]] std::optional<script_error> check_js_errors(
        const JSValue& js_value)
    {
        JSContext* ctx = _context.get();

        if (JS_IsException(js_value) || JS_IsError(ctx, js_value))
        {
            const raii_js_value js_exception{ctx, JS_GetException(ctx)};

            const raii_js_value js_stack_trace{
                ctx, JS_GetPropertyStr(ctx, js_exception._value, "stack")};

            const raii_js_cstring js_exception_str{ctx, js_exception._value};
            const raii_js_cstring js_stack_trace_str{
                ctx, js_stack_trace._value};

            const std::string_view js_stack_trace_sv =
                js_stack_trace_str.view();

            const auto js_stack_trace_line_num =
                [&]() -> std::optional<std::size_t>
            {
                using namespace std::string_view_literals;

                const auto needle = "(<evalScript>:"sv;
                const auto n_begin = js_stack_trace_sv.find(needle);

                if (n_begin == std::string_view::npos)
                {
                    return std::nullopt;
                }

                std::size_t result = 0;
                bool any_digit = false;

                for (std::size_t i = n_begin + needle.size();
                     i < js_stack_trace_sv.size(); ++i)
                {
                    const char c = js_stack_trace_sv[i];
                    if (c < '0' || c > '9')
                    {
                        break;
                    }

                    result = result * 10 + static_cast<std::size_t>(c - '0');
                    any_digit = true;
                }

                if (!any_digit)
                {
                    return std::nullopt;
                }

                return {result};
            }();

            error_diagnostic_stream("JS")
                << js_exception_str.view() << "\n\n"
                << js_stack_trace_sv << "\n\n"
                << "Interpreter line: '"
                << js_stack_trace_line_num.value_or(1) << "'\n";

            return script_error{._line = js_stack_trace_line_num.value_or(1)};
        }

        return std::nullopt;
    }

public:
    [[nodiscard]] explicit impl(std::ostream& err_stream) noexcept
        : _err_stream_tl_guard{&err_stream},
          _runtime{JS_NewRuntime()},
          _context{JS_NewContext(_runtime.get())},
          _script_loaded{false}
    {
        bind_function<&output_to_tl_buffer_pointee>("__pp_out", 1);
        bind_function<&include_file>("prepress_include", 1);
    }

    [[nodiscard]] std::optional<script_error> load_script(
        const std::string_view source) noexcept
    {
        const std::optional<script_error> result =
            check_js_errors(eval_impl(_context.get(), std::string{source})._value);

        _script_loaded = _script_loaded || !result.has_value();
        return result;
    }

    [[nodiscard]] bool script_loaded() const noexcept
    {
        return _script_loaded;
    }

    [[nodiscard]] std::optional<script_error> highlight(
        std::string& output_buffer, const std::string_view source,
        const code_options& options) noexcept
    {
        set_global_string("__pp_code", source);
        set_global_string(
            "__pp_lang", find_code_option(options, "lang").value_or(""));
        set_global_options("__pp_options", options);

        static const std::string call_source{
            "__pp_out(prepress_highlight(__pp_code, __pp_lang, "
            "__pp_options));"};

        tl_guard<&get_tl_buffer_ptr> buffer_ptr_guard{&output_buffer};
        return check_js_errors(eval_impl(_context.get(), call_source)._value);
    }
};

// ----------------------------------------------------------------------------

js_highlighter::js_highlighter(std::ostream& err_stream)
    : _impl{std::make_unique<impl>(err_stream)}
{}

js_highlighter::~js_highlighter() = default;

std::optional<js_highlighter::script_error> js_highlighter::load_script(
    const std::string_view source) noexcept
{
    return _impl->load_script(source);
}

std::optional<collaborators::error> js_highlighter::highlight_code(
    std::string& output_markup, const std::string_view source,
    const code_options& options)
{
    if (!_impl->script_loaded())
    {
        return offline_collaborators::highlight_code(
            output_markup, source, options);
    }

    std::string markup;
    const std::optional<script_error> err =
        _impl->highlight(markup, source, options);

    if (err.has_value())
    {
        return error{._reason = "highlighter script failed at line " +
                                std::to_string(err->_line)};
    }

    output_markup.append(markup);
    return std::nullopt;
}

} // namespace prepress
