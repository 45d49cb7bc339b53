// distill
//  Template resolution for build configuration documents
//  version 0.1.0 | MIT License
#pragma once

#include "distill/config.hh"
#include "distill/node.hh"

namespace distill {

  // Gather the raw lookup context for the configuration templates. Values
  // are copied (snapshot semantics) and never rendered here.
  //
  //   variables.*            namespaced global variables
  //   <name>                 the same variables, flattened
  //   registry_url           from the first primary registry entry
  //   registry_namespace     (also under variables.*)
  //   build.type.container.image_basename
  //   path.base              possibly still a template
  inline ordered_node build_context( const Config& cfg ) {
    using internal::key_string;
    using internal::make_node_from;

    ordered_node ctx = ordered_node::mapping();

    if ( cfg.variables.is_mapping() && cfg.variables.size() > 0 ) {
      ctx[ "variables" ] = cfg.variables;
      for ( const auto& [mk, mv] : cfg.variables.map_items() ) {
        ctx[ key_string(mk) ] = mv;
      }
    }

    if ( !cfg.registry.primary.empty() ) {
      const RegistryEndpoint& ep = cfg.primary_registry().second;
      ctx[ "registry_url" ] = make_node_from( ep.url );
      ctx[ "registry_namespace" ] = make_node_from( ep.namespace_ );

      if ( !ctx.contains("variables") || !ctx[ "variables" ].is_mapping() ) {
        ctx[ "variables" ] = ordered_node::mapping();
      }
      ctx[ "variables" ][ "registry_url" ] = make_node_from( ep.url );
      ctx[ "variables" ][ "registry_namespace" ]
        = make_node_from( ep.namespace_ );
    }

    if ( cfg.build_type ) {
      ordered_node container = ordered_node::mapping();
      container[ "image_basename" ]
        = make_node_from( cfg.build_type->container.image_basename );
      ordered_node type = ordered_node::mapping();
      type[ "container" ] = container;
      ordered_node build = ordered_node::mapping();
      build[ "type" ] = type;
      ctx[ "build" ] = build;
    }

    ordered_node path = ordered_node::mapping();
    path[ "base" ] = make_node_from( cfg.path.base );
    ctx[ "path" ] = path;

    return ctx;
  }

} // namespace distill
