#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "labelq/queue/v1/admin_service.grpc.pb.h"
#include "labelq/queue/v1/queue_service.grpc.pb.h"
#include "internal/export/sidecar_exporter.hpp"
#include "labelq/queue/v1.hpp"

using namespace labelq::queue::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  labelqctl <addr> next\n"
            << "  labelqctl <addr> submit <id> <token> <category>=<label>[,<label>]...\n"
            << "  labelqctl <addr> skip <id> <token>\n"
            << "  labelqctl <addr> release <id> <token>\n"
            << "  labelqctl <addr> progress\n"
            << "  labelqctl <addr> taxonomy\n"
            << "  labelqctl <addr> stats\n"
            << "  labelqctl <addr> list [pending|reserved|done] [limit]\n"
            << "  labelqctl <addr> get <id>\n"
            << "  labelqctl <addr> export <image_dir> [--no-overwrite]\n";
}

static uint64_t ParseID(const std::string& s) {
  char*      end = nullptr;
  const auto id  = std::strtoull(s.c_str(), &end, 10);
  if (s.empty() || *end != '\0' || id == 0) {
    std::cerr << "invalid item id: '" << s << "'\n";
    std::exit(1);
  }
  return id;
}

static std::optional<ItemStatus> ParseStatus(const std::string& value) {
  if (value == "pending") {
    return ITEM_STATUS_PENDING;
  }
  if (value == "reserved") {
    return ITEM_STATUS_RESERVED;
  }
  if (value == "done") {
    return ITEM_STATUS_DONE;
  }
  return std::nullopt;
}

static const char* StatusName(ItemStatus status) {
  switch (status) {
    case ITEM_STATUS_PENDING:
      return "pending";
    case ITEM_STATUS_RESERVED:
      return "reserved";
    case ITEM_STATUS_DONE:
      return "done";
    default:
      return "unspecified";
  }
}

// "hands=disfigured hand,extra finger" -> labels["hands"] += both values
static bool AddSelection(const std::string& arg, LabelSelection* selection) {
  const auto eq = arg.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) return false;

  auto&              values = (*selection->mutable_categories())[arg.substr(0, eq)];
  std::istringstream in(arg.substr(eq + 1));
  std::string        value;
  while (std::getline(in, value, ',')) {
    if (!value.empty()) values.add_values(value);
  }
  return true;
}

static std::string FormatLabels(const LabelSelection& selection) {
  std::string out;
  for (const auto& [category, values] : selection.categories()) {
    if (!out.empty()) out += ' ';
    out += category + "=";
    for (int i = 0; i < values.values_size(); ++i) {
      if (i > 0) out += ',';
      out += values.values(i);
    }
  }
  return out;
}

static void PrintRecord(const ItemRecord& record) {
  std::cout << record.id() << " " << record.name() << " status=" << StatusName(record.status());
  if (record.skipped()) std::cout << " skipped";
  if (record.reserved_until_ms() != 0) std::cout << " reserved_until_ms=" << record.reserved_until_ms();
  if (record.labels().categories_size() > 0) std::cout << " " << FormatLabels(record.labels());
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto queue_stub = LabelQueueService::NewStub(channel);
  auto admin_stub = LabelAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "next") {
    NextRequest  req;
    NextResponse resp;

    auto status = queue_stub->Next(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.status() == NextResponse::STATUS_EMPTY) {
      std::cout << "empty\n";
      return 0;
    }

    std::cout << "id=" << resp.item().id() << "\n";
    std::cout << "name=" << resp.item().name() << "\n";
    std::cout << "reference=" << resp.item().reference() << "\n";
    std::cout << "token=" << resp.reservation_token() << "\n";
    std::cout << "expires_at_ms=" << resp.expires_at_ms() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    SubmitRequest req;
    req.set_item_id(ParseID(argv[3]));
    req.set_reservation_token(argv[4]);
    for (int i = 5; i < argc; ++i) {
      if (!AddSelection(argv[i], req.mutable_labels())) {
        std::cerr << "invalid label selection: '" << argv[i] << "' (expected category=label[,label])\n";
        return 1;
      }
    }

    SubmitResponse resp;

    auto status = queue_stub->Submit(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "submitted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "skip") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    SkipRequest req;
    req.set_item_id(ParseID(argv[3]));
    req.set_reservation_token(argv[4]);

    SkipResponse resp;

    auto status = queue_stub->Skip(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "skipped\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "release") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    ReleaseRequest req;
    req.set_item_id(ParseID(argv[3]));
    req.set_reservation_token(argv[4]);

    ReleaseResponse resp;

    auto status = queue_stub->Release(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "released\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "progress") {
    ProgressRequest  req;
    ProgressResponse resp;

    auto status = queue_stub->Progress(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.completed() << "/" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "taxonomy") {
    GetTaxonomyRequest  req;
    GetTaxonomyResponse resp;

    auto status = queue_stub->GetTaxonomy(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& category : resp.categories()) {
      std::cout << category.id() << " (" << category.name() << ")\n";
      for (const auto& label : category.labels()) {
        std::cout << "  " << label.id() << " (" << label.name() << ")";
        if (!label.shortcut().empty()) std::cout << " [" << label.shortcut() << "]";
        std::cout << "\n";
      }
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "pending=" << resp.pending() << "\n";
    std::cout << "reserved=" << resp.reserved_live() << "\n";
    std::cout << "done=" << resp.done() << "\n";
    std::cout << "skipped=" << resp.skipped() << "\n";
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListItemsRequest req;
    if (argc >= 4) {
      auto parsed = ParseStatus(argv[3]);
      if (!parsed.has_value()) {
        std::cerr << "unsupported status: " << argv[3] << "\n";
        return 1;
      }
      req.set_status(parsed.value());
    }
    if (argc >= 5) {
      req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));
    }

    ListItemsResponse resp;

    auto status = admin_stub->ListItems(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& record : resp.records()) {
      PrintRecord(record);
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetItemRequest req;
    req.set_id(ParseID(argv[3]));

    GetItemResponse resp;

    auto status = admin_stub->GetItem(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintRecord(resp.record());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "export") {
    if (argc < 4 || argc > 5 || (argc == 5 && std::string(argv[4]) != "--no-overwrite")) {
      Usage();
      return 1;
    }

    labelq::exporter::SidecarOptions options;
    options.image_dir = argv[3];
    options.overwrite = argc < 5;

    grpc::Status failed;
    auto         list_page = [&](const ListItemsRequest& req) {
      grpc::ClientContext page_ctx;
      ListItemsResponse   resp;
      auto                status = admin_stub->ListItems(&page_ctx, req, &resp);
      if (!status.ok()) {
        failed = status;
        throw std::runtime_error("list items: " + status.error_message());
      }
      return resp;
    };

    try {
      const auto summary = labelq::exporter::ExportLabelSidecars(list_page, options);
      std::cout << "wrote " << summary.written << " file(s)";
      if (summary.skipped > 0) std::cout << ", skipped " << summary.skipped;
      std::cout << "\n";
    } catch (const std::exception& e) {
      if (!failed.ok()) return Fail(failed);
      std::cerr << "export failed: " << e.what() << "\n";
      return 2;
    }
    return 0;
  }

  Usage();
  return 1;
}
