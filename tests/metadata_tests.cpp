#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <sdcron/metadata.hpp>

#include <string>

using namespace sdcron;

static ManagedUnit full_timer() {
  ManagedUnit u;
  u.name = "report";
  auto t = TimerJob::compile("*/15 8-18 * * mon-fri");
  t.random_delay = "5m";
  u.job = t;
  u.command = "uv run ./report.py --out 'daily report.pdf'";
  u.workdir = "/home/me/project";
  u.description = "daily report";
  u.memory_max = "512M";
  u.cpu_quota = "50%";
  u.io_weight = 100;
  u.stop_timeout = "30s";
  u.exec_start_pre = "mkdir -p out";
  u.exec_stop_post = "rm -f out/.lock";
  u.log_level_max = "info";
  u.environment = {"A=1", "B=two words"};
  return u;
}

static ManagedUnit plain_service() {
  ManagedUnit u;
  u.name = "web";
  u.job = ServiceJob{std::string("/srv/web/.env"), RestartPolicy::OnFailure};
  u.command = "node dist/index.js";
  u.workdir = "/srv/web";
  return u;
}

TEST_CASE("encode emits keys in fixed order") {
  auto text = encode_metadata(plain_service());
  REQUIRE(text == "# sdcron:version=1\n"
                  "# sdcron:type=service\n"
                  "# sdcron:restart=on-failure\n"
                  "# sdcron:command=node dist/index.js\n"
                  "# sdcron:workdir=/srv/web\n"
                  "# sdcron:env_file=/srv/web/.env\n");
}

TEST_CASE("timer metadata keeps the cron text verbatim") {
  auto text = encode_metadata(full_timer());
  REQUIRE(text.find("# sdcron:cron=*/15 8-18 * * mon-fri\n") != std::string::npos);
  REQUIRE(text.find("restart=") == std::string::npos);
  REQUIRE(text.find("# sdcron:io_weight=100\n") != std::string::npos);
  REQUIRE(text.find("# sdcron:env=A=1\n# sdcron:env=B=two words\n") !=
          std::string::npos);
}

TEST_CASE("metadata round-trip") {
  for (const auto &u : {full_timer(), plain_service()}) {
    auto back = unit_from_metadata(u.name, decode_metadata(encode_metadata(u)));
    REQUIRE(back == u);
  }

  auto reboot = plain_service();
  reboot.job = TimerJob::compile("@reboot");
  auto back = unit_from_metadata("web", decode_metadata(encode_metadata(reboot)));
  REQUIRE(back == reboot);
}

TEST_CASE("unknown keys pass through in order") {
  auto text = "[Unit]\nDescription=x\n" + encode_metadata(plain_service()) +
              "# sdcron:future_key=42\n# sdcron:another=a=b\n";
  auto f = decode_metadata(text);
  REQUIRE(f.extra.size() == 2);
  REQUIRE(f.extra[0] == MetadataEntry("future_key", std::string("42")));
  REQUIRE(f.extra[1] == MetadataEntry("another", std::string("a=b")));

  auto u = unit_from_metadata("web", f);
  auto again = encode_metadata(u);
  REQUIRE(again.find("# sdcron:future_key=42\n# sdcron:another=a=b\n") !=
          std::string::npos);
}

TEST_CASE("unknown keys without a value are re-emitted unchanged") {
  auto block = encode_metadata(plain_service()) +
               "# sdcron:future\n# sdcron:empty=\n";
  auto f = decode_metadata(block);
  REQUIRE(f.extra.size() == 2);
  REQUIRE(f.extra[0] == MetadataEntry("future", std::nullopt));
  REQUIRE(f.extra[1] == MetadataEntry("empty", std::string()));

  auto u = unit_from_metadata("web", f);
  REQUIRE(encode_metadata(u) == block);
}

TEST_CASE("non-metadata lines are ignored") {
  auto f = decode_metadata("[Service]\nExecStart=/bin/true\n# plain comment\n");
  REQUIRE_FALSE(f.present);
  REQUIRE_THROWS_AS(unit_from_metadata("x", f), CodecError);
}

TEST_CASE("malformed recognized values are codec errors") {
  auto key_of = [](const std::string &text) {
    try {
      decode_metadata(text);
    } catch (const CodecError &e) {
      return e.key();
    }
    return std::string("<none>");
  };
  REQUIRE(key_of("# sdcron:type=daemon\n") == "type");
  REQUIRE(key_of("# sdcron:restart=sometimes\n") == "restart");
  REQUIRE(key_of("# sdcron:io_weight=heavy\n") == "io_weight");
  REQUIRE(key_of("# sdcron:version=0\n") == "version");
  REQUIRE(key_of("# sdcron:command\n") == "command");
  REQUIRE(key_of("# sdcron:whatever\n") == "<none>");
}

TEST_CASE("unit_from_metadata enforces required and kind keys") {
  auto decode = [](const std::string &text) {
    return unit_from_metadata("job", decode_metadata(text));
  };
  const std::string base = "# sdcron:command=/bin/true\n# sdcron:workdir=/tmp\n";

  REQUIRE_THROWS_AS(decode(base), CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=timer\n" + base), CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=timer\n# sdcron:cron=@service\n" + base),
                    CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=timer\n# sdcron:cron=* * *\n" + base),
                    CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=timer\n# sdcron:cron=@daily\n"
                           "# sdcron:restart=always\n" + base),
                    CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=service\n# sdcron:random_delay=1m\n" +
                           base),
                    CodecError);
  REQUIRE_THROWS_AS(decode("# sdcron:type=service\n# sdcron:command=/bin/true\n"
                           "# sdcron:workdir=relative\n"),
                    CodecError);

  auto svc = decode("# sdcron:type=service\n" + base);
  REQUIRE(svc.is_service());
  REQUIRE(svc.service()->restart == RestartPolicy::Always);

  auto t = decode("# sdcron:type=timer\r\n# sdcron:cron=@daily/6\r\n" + base);
  REQUIRE(t.timer()->cron == "@daily/6");
}
