// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace distill {

  // Base class of everything thrown by the library
  class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // The configuration could not be read, parsed, validated or resolved
  class ConfigurationError : public Error {
  public:
    using Error::Error;
  };

  // One schema violation, e.g. { "config.path.base", "field required" }
  struct FieldViolation {
    std::string field;
    std::string message;
  };

  // Raised before any template is rendered when the document does not honor
  // the configuration schema. All violations are reported together.
  class StructuralError : public ConfigurationError {
  public:
    inline explicit StructuralError( std::vector< FieldViolation > v )
      : ConfigurationError( compose(v) ), violations_( std::move(v) ) {}

    const std::vector< FieldViolation >& violations() const {
      return violations_;
    }

  private:
    static std::string compose( const std::vector< FieldViolation >& v );

    std::vector< FieldViolation > violations_;
  };

  // A single placeholder path could not be resolved. Not thrown: the lenient
  // expander logs it, the strict engine turns it into a TemplateError.
  struct LookupFailure {
    std::string path; // full dotted path that was looked up
    std::string segment; // first segment that could not be resolved
    std::string reason;

    std::string describe() const;
  };

  class TemplateError : public Error {
  public:

    enum class Kind { UndefinedVariable, NonConvergence, Syntax };

    // Everything needed to diagnose a failed render without re-running it
    struct Details {
      Kind what = Kind::Syntax;
      int pass = 0; // 1-based pass number at failure
      std::string message;
      std::string template_snippet; // bounded prefix of the original template
      std::string last_result; // bounded prefix of the last intermediate text
      std::vector< std::string > available_keys; // top-level context keys
      std::string undefined_path; // undefined_variable only
      std::string undefined_root; // first segment of undefined_path
    };

    inline explicit TemplateError( Details d )
      : Error( compose(d) ), details_( std::move(d) ) {}

    Kind what_kind() const { return details_.what; }
    int pass() const { return details_.pass; }
    const Details& info() const { return details_; }

  private:
    static std::string compose( const Details& d );

    Details details_;
  };

  inline const char* to_string( TemplateError::Kind k ) {
    switch ( k ) {
      case TemplateError::Kind::UndefinedVariable:
        return "undefined variable";
      case TemplateError::Kind::NonConvergence: return "non-convergence";
      case TemplateError::Kind::Syntax: return "syntax error";
    }
    return "unknown";
  }

} // namespace distill

inline std::string distill::StructuralError::compose(
  const std::vector< FieldViolation >& v )
{
  std::ostringstream oss;
  oss << "Configuration validation failed: " << v.size()
    << ( v.size() == 1 ? " violation" : " violations" );
  for ( const auto& fv : v ) {
    oss << "\n  " << fv.field << ": " << fv.message;
  }
  return oss.str();
}

inline std::string distill::LookupFailure::describe() const {
  std::ostringstream oss;
  oss << "cannot resolve '" << path << "'";
  if ( !segment.empty() || !reason.empty() ) {
    oss << " at segment '" << segment << "'";
  }
  if ( !reason.empty() ) oss << " (" << reason << ')';
  return oss.str();
}

// Compose "<kind> at pass N: message" followed by the diagnosis context
inline std::string distill::TemplateError::compose( const Details& d ) {
  std::ostringstream oss;
  oss << "Template " << to_string( d.what ) << " at pass " << d.pass;
  if ( !d.message.empty() ) oss << ": " << d.message;
  oss << "\nTemplate: " << d.template_snippet;
  if ( !d.last_result.empty() ) oss << "\nLast result: " << d.last_result;
  oss << "\nContext keys: [";
  for ( size_t i = 0; i < d.available_keys.size(); ++i ) {
    if ( i ) oss << ", ";
    oss << d.available_keys[ i ];
  }
  oss << ']';
  return oss.str();
}
