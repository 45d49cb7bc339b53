#include "distill/loader.hh"

#include <iostream>
#include <string>
#include <utility>

namespace {

  void usage( std::ostream& os ) {
    os << "usage: distill [--quiet | --verbose] [--dump] [config.yaml]\n";
  }

  const char* yes_no( bool b ) { return b ? "True" : "False"; }

  void print_summary( const distill::ResolvedConfig& rc, std::ostream& os ) {
    const distill::Config& cfg = rc.cfg;
    const std::string rule( 60, '-' );

    os << "Configuration Summary:\n" << rule << '\n';

    os << "\nPaths:\n"
      << "    Base:       " << cfg.path.base << '\n'
      << "    Downloads:  " << cfg.path.downloads << '\n'
      << "    Sources:    " << cfg.path.sources << '\n'
      << "    Build:      " << cfg.path.build << '\n'
      << "    Libraries:  " << cfg.path.generated.libraries << '\n'
      << "    Apps:       " << cfg.path.generated.applications;
    if ( rc.applications_state == distill::PathState::PartiallyResolved ) {
      os << "  (resolved per package at build time)";
    }
    os << '\n';

    os << "\nBuild User:\n";
    if ( cfg.build_user ) {
      os << "    Name:     " << cfg.build_user->name << '\n'
        << "    UID:GID:  " << cfg.build_user->uid << ':'
        << cfg.build_user->gid << '\n'
        << "    Home:     " << cfg.build_user->homedir << '\n';
    }

    os << "\nBuild Variants:\n";
    for ( const auto& v : rc.variants ) {
      os << "    " << v.name << ":\n"
        << "      Alpine:  " << v.metadata.alpine_version << '\n'
        << "      musl:    " << v.metadata.musl_version << '\n'
        << "      Image:   " << v.image << '\n';
    }

    const auto& [reg_name, reg] = cfg.primary_registry();
    os << "\nPrimary Registry:\n"
      << "    Type:      " << reg_name << '\n'
      << "    URL:       " << reg.url << '\n'
      << "    Namespace: " << reg.namespace_ << '\n';
    if ( const auto* fb = cfg.fallback_registry() ) {
      os << "\nFallback Registry:\n"
        << "    Type:      " << fb->first << '\n'
        << "    URL:       " << fb->second.url << '\n';
    }

    const auto& [repo_name, repo] = cfg.primary_repository();
    os << "\nPrimary Repository:\n"
      << "    Type: " << repo_name << '\n'
      << "    URL:  " << distill::base_url( repo ) << '\n';

    os << "\nDefaults:\n"
      << "    Variant:            " << cfg.defaults.build.variant << '\n'
      << "    Architecture:       " << cfg.defaults.build.arch << '\n'
      << "    Cleanup on success: "
      << yes_no( cfg.defaults.build.cleanup_on_success ) << '\n'
      << "    Generate SBOM:      "
      << yes_no( cfg.defaults.packaging.generate_sbom ) << '\n';

    os << "\nGitHub:\n"
      << "    API:   " << cfg.github.api_url << '\n'
      << "    Token: " << ( cfg.github.token ? "set" : "None" )
      << '\n';
  }

  // Resolved paths and images as YAML
  distill::ordered_node dump_node( const distill::ResolvedConfig& rc ) {
    using distill::ordered_node;
    using distill::internal::make_node_from;
    const distill::PathConfig& p = rc.cfg.path;

    ordered_node generated = ordered_node::mapping();
    generated[ "libraries" ] = make_node_from( p.generated.libraries );
    generated[ "applications" ] = make_node_from( p.generated.applications );
    ordered_node path = ordered_node::mapping();
    path[ "base" ] = make_node_from( p.base );
    path[ "downloads" ] = make_node_from( p.downloads );
    path[ "sources" ] = make_node_from( p.sources );
    path[ "build" ] = make_node_from( p.build );
    path[ "generated" ] = generated;

    ordered_node variants = ordered_node::mapping();
    for ( const auto& v : rc.variants ) {
      variants[ v.name ] = make_node_from( v.image );
    }

    ordered_node out = ordered_node::mapping();
    out[ "path" ] = path;
    out[ "variants" ] = variants;
    return out;
  }

} // namespace

int main( int argc, char* argv[] ) {
  try {
    std::string path = distill::ConfigLoader::DEFAULT_CONFIG_PATH;
    bool dump = false;
    bool level_forced = false;

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--quiet" ) {
        distill::diag().set_threshold( distill::LogLevel::Warning );
        level_forced = true;
      }
      else if ( arg == "--verbose" ) {
        distill::diag().set_threshold( distill::LogLevel::Debug );
        level_forced = true;
      }
      else if ( arg == "--dump" ) dump = true;
      else if ( arg == "--help" || arg == "-h" ) {
        usage( std::cout );
        return 0;
      }
      else if ( !arg.empty() && arg[0] == '-' ) {
        usage( std::cerr );
        return 1;
      }
      else path = arg;
    }

    // Logging settings from the document apply to its own resolution,
    // unless a level was forced on the command line
    const distill::ConfigLoader loader( path );
    distill::ConfigFile file = loader.read();
    distill::configure_logger( distill::diag(), file.cfg.logging,
      level_forced );
    const distill::ResolvedConfig rc = loader.resolve( std::move(file) );

    if ( dump ) {
      std::cout << distill::ordered_node::serialize( dump_node(rc) );
    }
    else {
      print_summary( rc, std::cout );
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[distill] error: " << ex.what() << "\n";
    return 1;
  }
}
