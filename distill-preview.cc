#include "distill/loader.hh"
#include "distill/preview.hh"

#include <iostream>
#include <string>

namespace {

  void usage( std::ostream& os ) {
    os << "usage: distill-preview --package NAME --variant NAME"
      " --tag library|application\n"
      "                       [--config config.yaml]"
      " [--packages packages.yaml]\n";
  }

} // namespace

// Preview the build commands of one package: every command template is
// expanded leniently and printed, nothing is executed
int main( int argc, char* argv[] ) {
  try {
    distill::PackageRequest req;
    req.variant = "stable";
    std::string config_path = "config.yaml";
    std::string packages_path = "packages.yaml";

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--help" || arg == "-h" ) {
        usage( std::cout );
        return 0;
      }
      if ( i + 1 >= argc ) {
        usage( std::cerr );
        return 1;
      }
      const std::string value = argv[ ++i ];
      if ( arg == "--package" ) req.package = value;
      else if ( arg == "--variant" ) req.variant = value;
      else if ( arg == "--tag" ) req.tag = value;
      else if ( arg == "--config" ) config_path = value;
      else if ( arg == "--packages" ) packages_path = value;
      else {
        usage( std::cerr );
        return 1;
      }
    }
    if ( req.package.empty() || req.tag.empty() ) {
      usage( std::cerr );
      return 1;
    }

    const distill::ordered_node config_doc
      = distill::read_yaml_file( config_path );
    const distill::ordered_node packages_doc
      = distill::read_yaml_file( packages_path );

    const distill::PreviewContext pc = distill::build_preview_context(
      config_doc, packages_doc, req );

    std::cout << "Building " << req.package << " - variant: " << req.variant
      << " (" << pc.full_version() << ")\n"
      << "Prefix: " << pc.default_prefix() << '\n';

    distill::PrintSink sink( std::cout );
    distill::submit_commands( packages_doc, req, pc, sink );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[distill] error: " << ex.what() << "\n";
    return 1;
  }
}
