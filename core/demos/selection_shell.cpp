// Selection shell for TagList
// Reads newline-delimited JSON commands from stdin, writes one JSON reply per line to stdout.
// Protocol:
//   {"cmd":"open","path":"/some/dir"}      open a directory as the repository
//   {"cmd":"close"}
//   {"cmd":"query","query":"inpath:src/"}  filter items, clears the selection
//   {"cmd":"status"}
//   {"cmd":"selection"}
//   {"cmd":"isolate"|"add"|"addTo"|"remove"|"extendTo","itemId":N}  (or "position":N)
//   {"cmd":"clear"}
// Reply: {"ok":true,...} or {"ok":false,"code":"...","message":"..."}

#include "tl/commands/SelectionCommands.hpp"
#include "tl/data/ScanBackend.hpp"
#include "tl/session/AppSession.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool readLine(std::string& line) {
  line.clear();
  int c;
  while ((c = std::fgetc(stdin)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  return !(c == EOF && line.empty());
}

static void writeLine(const std::string& json) {
  std::fwrite(json.data(), 1, json.size(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

static std::string errorReply(const tl::CmdError& err) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("ok");      w.Bool(false);
  w.Key("code");    w.String(err.code.c_str());
  w.Key("message"); w.String(err.message.c_str());
  w.EndObject();
  return sb.GetString();
}

static std::string statusReply(const tl::AppSession& session) {
  const auto& st = session.state();
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("ok");        w.Bool(true);
  w.Key("status");    w.String(st.status.c_str());
  w.Key("path");
  if (st.path.empty()) w.Null(); else w.String(st.path.c_str());
  w.Key("query");     w.String(st.query.c_str());
  w.Key("itemCount"); w.Uint64(st.itemIds.size());
  w.EndObject();
  return sb.GetString();
}

static std::string selectionReply(const tl::SelectionCommands& commands) {
  return std::string(R"({"ok":true,"selection":)") + commands.selectionJson() + "}";
}

static std::string stringField(const rapidjson::Document& d, const char* key) {
  auto it = d.FindMember(key);
  if (it == d.MemberEnd() || !it->value.IsString()) return {};
  return it->value.GetString();
}

// ---------------------------------------------------------------------------
// Main loop
// ---------------------------------------------------------------------------

int main() {
  tl::ScanBackend backend;
  tl::AppSession session(backend);
  tl::SelectionCommands commands(session.selection());

  session.refreshAll();

  std::string line;
  while (readLine(line)) {
    if (line.empty()) continue;

    rapidjson::Document d;
    d.Parse(line.c_str());
    if (d.HasParseError() || !d.IsObject()) {
      std::fprintf(stderr, "selection_shell: ignoring malformed line\n");
      writeLine(errorReply({"BAD_COMMAND", "invalid JSON object", "{}"}));
      continue;
    }

    const std::string cmd = stringField(d, "cmd");

    if (cmd == "open") {
      std::string path = stringField(d, "path");
      if (path.empty()) {
        writeLine(errorReply({"BAD_COMMAND", "open: missing path", "{}"}));
      } else if (!session.openRepo(path)) {
        writeLine(errorReply({"OPEN_FAILED", session.lastError(), "{}"}));
      } else {
        writeLine(statusReply(session));
      }
      continue;
    }
    if (cmd == "close") {
      session.closeRepo();
      writeLine(statusReply(session));
      continue;
    }
    if (cmd == "query") {
      session.setQuery(stringField(d, "query"));
      writeLine(statusReply(session));
      continue;
    }
    if (cmd == "status") {
      session.refreshAll();
      writeLine(statusReply(session));
      continue;
    }
    if (cmd == "selection") {
      writeLine(selectionReply(commands));
      continue;
    }

    tl::CmdResult r = commands.applyJson(d);
    if (!r.ok) {
      writeLine(errorReply(r.err));
    } else {
      writeLine(selectionReply(commands));
    }
  }

  session.closeRepo();
  return 0;
}
