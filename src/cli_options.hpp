#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "common.hpp"
#include "program_state.hpp"

#include <boost/program_options.hpp>
#include <boost/describe.hpp>
#include <boost/describe/enum_to_string.hpp>
#include <boost/describe/enum_from_string.hpp>

namespace po = boost::program_options;

/// \brief Command-line option holding value of the described enum
template <IsDescribedEnum E>
class EnumOption {
  public:
    EnumOption(E in) : value(in) {}

    inline E get() const noexcept { return value; }

  private:
    E value;
};

/// \brief more informative validation error exception
///
/// Derived from the regular validation error and only providing support
/// for the user-provided error elaboration.
class validation_error : public po::validation_error {
    Str msg; ///< Base message concatenated with the elaboration

  public:
    /// \brief create validation error with 'invalid option' state
    inline validation_error(CR<Str> _msg)
        : po::validation_error(po::validation_error::invalid_option_value)
        , msg(Str{po::validation_error::what()} + ": " + _msg) {}

    inline const char* what() const noexcept override {
        return msg.c_str();
    }
};

/// \brief specify boolean true/false flags on the boost command line
///
/// Flag can be given as `--flag`, `--flag=true` or `--flag=false`, config
/// files use `flag=true` form.
class BoolOption {
  public:
    inline BoolOption(bool initialState = false) : state(initialState) {}
    inline bool getState() const { return state; }
    /// \brief boolean conversion operator for seamless interoperability
    /// with the regular boolean types
    operator bool() const { return state; }

  private:
    bool state;
};

/// \brief parse enum-valued CLI option
template <IsDescribedEnum E>
void validate(boost::any& v, CR<Vec<Str>> xs, EnumOption<E>*, long) {
    po::validators::check_first_occurrence(v);
    Str const& in = po::validators::get_single_string(xs);
    E          result;
    if (bd::enum_from_string<E>(in.c_str(), result)) {
        v = EnumOption<E>(result);
    } else {
        Vec<Str> names;
        boost::mp11::mp_for_each<bd::describe_enumerators<E>>(
            [&](auto D) { names.push_back(D.name); });
        throw validation_error(fmt::format(
            "invalid enumerator name '{}', expected one of {}",
            in,
            fmt::join(names, ", ")));
    }
}

/// \brief parse `true/false/on/off/1/0` value of the boolean flag
void validate(boost::any& v, CR<Vec<Str>> xs, BoolOption*, long);

/// \brief Description of every supported option
po::options_description make_options();

/// \brief Parse command line and all config files referenced with
/// `--config`. Command line values take precedence over config files.
/// Returns empty optional if help was requested and printed.
///
/// Throws `po::error` on invalid options.
Opt<po::variables_map> parse_cmdline(int argc, const char** argv);

/// \brief Build run configuration from the parsed options. Throws
/// `validation_error` for inconsistent values.
miner_config config_from_options(CR<po::variables_map> vm);

#endif // CLI_OPTIONS_HPP
