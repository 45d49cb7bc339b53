#pragma once

#include <string>

#ifndef DISTILL_TEST_DATA_DIR
#define DISTILL_TEST_DATA_DIR "config"
#endif

namespace distill_test {

  inline std::string data_file( const std::string& name ) {
    return std::string( DISTILL_TEST_DATA_DIR ) + "/" + name;
  }

  // Smallest document that passes validation and exercises every
  // resolution stage
  inline std::string minimal_config_yaml() {
    return
      "version: \"1.0.0\"\n"
      "schema: distillery-config\n"
      "config:\n"
      "  variables:\n"
      "    registry_url: example.com\n"
      "    base_dir: /data\n"
      "  path:\n"
      "    base: \"/data/{{ variables.registry_url }}\"\n"
      "    downloads: \"{{ path.base }}/downloads\"\n"
      "    sources: \"{{ path.base }}/sources\"\n"
      "    build: /tmp/build\n"
      "    generated:\n"
      "      libraries: \"{{ path.base }}/libraries\"\n"
      "      applications: \"/apps/{{ package.name }}\"\n"
      "  build:\n"
      "    type:\n"
      "      container:\n"
      "        image_basename: builda-bar\n"
      "    variant:\n"
      "      stable:\n"
      "        image: \"{{ build.type.container.image_basename }}:"
      "{{ this.metadata.alpine_version }}\"\n"
      "        metadata:\n"
      "          alpine_version: \"3.19\"\n"
      "          musl_version: \"1.2.4\"\n"
      "          kernel: \"6.6\"\n"
      "  registry:\n"
      "    primary:\n"
      "      local:\n"
      "        url: example.com\n"
      "        namespace: distillery\n"
      "  repository:\n"
      "    primary:\n"
      "      nexus:\n"
      "        url: https://nexus.example.com\n"
      "        repository: raw-hosted\n";
  }

} // namespace distill_test
