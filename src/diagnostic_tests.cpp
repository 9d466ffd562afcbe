#include "diagnostic.h"

#include "doctest.h"

namespace sdkgraph {

TEST_CASE("diagnostic formats module, variant and property") {
  CHECK(diagnostic{ .module = "libfoo", .variant = {}, .property = {}, .message = "bad" }
            .to_string() == "module \"libfoo\": bad");
  CHECK(diagnostic{ .module = "libfoo", .variant = "myapex", .property = {}, .message = "bad" }
            .to_string() == "module \"libfoo\" variant \"myapex\": bad");
  CHECK(diagnostic{ .module = "mysdk", .variant = {}, .property = "name", .message = "bad" }
            .to_string() == "module \"mysdk\": name: bad");
  CHECK(diagnostic{ .module = "mysdk", .variant = "v", .property = "name", .message = "bad" }
            .to_string() == "module \"mysdk\" variant \"v\": name: bad");
}

}  // namespace sdkgraph
