#include <doctest/doctest.h>
#include <buckle/files.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace buckle;
using buckle::test::TempDir;
using buckle::test::read_text;
using buckle::test::write_file;

namespace {

Package package_at(const TempDir& temp) {
    Package pkg;
    pkg.id = "web";
    pkg.description = "web server";
    pkg.root_dir = temp.path("web");
    pkg.files_dir = temp.path("web/files");
    return pkg;
}

} // namespace

TEST_CASE("strip_template_suffix removes a trailing .tpl") {
    CHECK(strip_template_suffix("app.conf.tpl") == "app.conf");
    CHECK(strip_template_suffix("sub/dir/x.tpl") == "sub/dir/x");
    CHECK(strip_template_suffix("app.conf") == "app.conf");
    CHECK(strip_template_suffix(".tpl") == ".tpl");
}

TEST_CASE("collect_file_mappings maps groups to their targets") {
    TempDir temp;
    write_file(temp.path("web/files/confd/app.conf.tpl"), "ip={{ .IP }}\n");
    write_file(temp.path("web/files/confd/app.conf"), "static\n");
    write_file(temp.path("web/files/confd/sub/nested.txt"), "n\n");

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg);
    REQUIRE(mappings.isOk());
    REQUIRE(mappings.value().size() == 3);

    const auto& plain = mappings.value()[0];
    CHECK(plain.group == "confd");
    CHECK(plain.source_relative_path == "app.conf");
    CHECK(plain.destination_path == "/etc/app/app.conf");
    CHECK_FALSE(plain.is_template);

    const auto& tpl = mappings.value()[1];
    CHECK(tpl.source_relative_path == "app.conf.tpl");
    CHECK(tpl.destination_path == "/etc/app/app.conf");
    CHECK(tpl.is_template);

    const auto& nested = mappings.value()[2];
    CHECK(nested.source_relative_path == "sub/nested.txt");
    CHECK(nested.destination_path == "/etc/app/sub/nested.txt");
}

TEST_CASE("an unmapped group deploys relative to the filesystem root") {
    TempDir temp;
    write_file(temp.path("web/files/etc/motd"), "welcome\n");

    auto mappings = collect_file_mappings(package_at(temp));
    REQUIRE(mappings.isOk());
    REQUIRE(mappings.value().size() == 1);
    CHECK(mappings.value()[0].destination_path == "/motd");
}

TEST_CASE("target_root re-bases every destination") {
    TempDir temp;
    write_file(temp.path("web/files/confd/app.conf"), "x\n");

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg, temp.path("stage"));
    REQUIRE(mappings.isOk());
    CHECK(mappings.value()[0].destination_path == to_portable_path(temp.path("stage")) + "/etc/app/app.conf");
}

TEST_CASE("a package without files has no mappings") {
    TempDir temp;
    auto mappings = collect_file_mappings(package_at(temp));
    REQUIRE(mappings.isOk());
    CHECK(mappings.value().empty());
}

TEST_CASE("templates are rendered and plain files copied byte-identical") {
    TempDir temp;
    std::string binary("\x00\x01\xff{{ .IP }}\r\n", 14);
    write_file(temp.path("web/files/confd/app.conf.tpl"), "listen {{ .IP }}\n");
    write_file(temp.path("web/files/confd/blob.bin"), binary);

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg, temp.path("root"));
    REQUIRE(mappings.isOk());

    auto prepared = prepare_files(mappings.value(), {{"IP", "10.0.0.5"}});
    REQUIRE(prepared.isOk());
    for (const auto& file : prepared.value()) {
        REQUIRE(deploy_file(file).isOk());
    }

    CHECK(read_text(temp.path("root/etc/app/app.conf")) == "listen 10.0.0.5\n");
    CHECK(read_text(temp.path("root/etc/app/blob.bin")) == binary);
    CHECK_FALSE(fs::exists(temp.path("root/etc/app/app.conf.tpl")));
}

TEST_CASE("deploy_file overwrites existing destinations") {
    TempDir temp;
    write_file(temp.path("web/files/confd/app.conf"), "new content\n");
    write_file(temp.path("root/etc/app/app.conf"), "old content that is longer\n");

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg, temp.path("root"));
    REQUIRE(mappings.isOk());
    auto prepared = prepare_files(mappings.value(), {});
    REQUIRE(prepared.isOk());
    REQUIRE(deploy_file(prepared.value()[0]).isOk());

    CHECK(read_text(temp.path("root/etc/app/app.conf")) == "new content\n");
}

TEST_CASE("a template error stops preparation before anything is written") {
    TempDir temp;
    write_file(temp.path("web/files/confd/a.txt"), "a\n");
    write_file(temp.path("web/files/confd/b.conf.tpl"), "{{ .UNDEFINED }}\n");

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg, temp.path("root"));
    REQUIRE(mappings.isOk());

    auto prepared = prepare_files(mappings.value(), {});
    REQUIRE(prepared.isErr());
    CHECK(prepared.error().code() == ErrorCode::TEMPLATE_ERROR);
    CHECK(prepared.error().path().find("b.conf.tpl") != std::string::npos);
    CHECK_FALSE(fs::exists(temp.path("root")));
}

#ifndef _WIN32
TEST_CASE("a write failure is a permission error") {
    TempDir temp;
    write_file(temp.path("web/files/confd/app.conf"), "x\n");
    write_file(temp.path("blocker"), "a regular file where a directory is needed\n");

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/";

    auto mappings = collect_file_mappings(pkg, temp.path("blocker"));
    REQUIRE(mappings.isOk());
    auto prepared = prepare_files(mappings.value(), {});
    REQUIRE(prepared.isOk());

    auto deployed = deploy_file(prepared.value()[0]);
    REQUIRE(deployed.isErr());
    CHECK(deployed.error().code() == ErrorCode::PERMISSION_ERROR);
}

TEST_CASE("a directory symlink back into the group is not followed") {
    TempDir temp;
    write_file(temp.path("web/files/etc/sub/app.conf"), "x\n");
    fs::create_directory_symlink("..", temp.path("web/files/etc/sub/loop"));

    Package pkg = package_at(temp);
    pkg.files["etc"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg);
    REQUIRE(mappings.isOk());
    REQUIRE(mappings.value().size() == 1);
    CHECK(mappings.value()[0].source_relative_path == "sub/app.conf");
}

TEST_CASE("a directory symlink to a sibling tree is followed") {
    TempDir temp;
    write_file(temp.path("shared/motd"), "hello\n");
    write_file(temp.path("web/files/etc/own.txt"), "own\n");
    fs::create_directory_symlink(temp.path("shared"), temp.path("web/files/etc/shared"));

    Package pkg = package_at(temp);
    pkg.files["etc"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg);
    REQUIRE(mappings.isOk());
    REQUIRE(mappings.value().size() == 2);
    CHECK(mappings.value()[0].source_relative_path == "own.txt");
    CHECK(mappings.value()[1].source_relative_path == "shared/motd");
}

TEST_CASE("a files path that is not a directory is an IO error") {
    TempDir temp;
    write_file(temp.path("web/files"), "not a directory\n");

    auto mappings = collect_file_mappings(package_at(temp));
    REQUIRE(mappings.isErr());
    CHECK(mappings.error().code() == ErrorCode::IO_ERROR);
    CHECK(mappings.error().package_id() == "web");
}

TEST_CASE("a rendered template keeps the permissions of the file it replaces") {
    TempDir temp;
    write_file(temp.path("web/files/confd/secret.conf.tpl"), "token={{ .TOKEN }}\n");
    write_file(temp.path("root/etc/app/secret.conf"), "token=old\n");
    fs::permissions(temp.path("root/etc/app/secret.conf"),
                    fs::perms::owner_read | fs::perms::owner_write);

    Package pkg = package_at(temp);
    pkg.files["confd"] = "/etc/app";

    auto mappings = collect_file_mappings(pkg, temp.path("root"));
    REQUIRE(mappings.isOk());
    auto prepared = prepare_files(mappings.value(), {{"TOKEN", "new"}});
    REQUIRE(prepared.isOk());
    REQUIRE(deploy_file(prepared.value()[0]).isOk());

    CHECK(read_text(temp.path("root/etc/app/secret.conf")) == "token=new\n");
    auto perms = fs::status(temp.path("root/etc/app/secret.conf")).permissions();
    CHECK(perms == (fs::perms::owner_read | fs::perms::owner_write));
}

TEST_CASE("a new rendered file takes the permissions of its template") {
    TempDir temp;
    write_file(temp.path("web/files/bin/run.sh.tpl"), "#!/bin/sh\necho {{ .NAME }}\n");
    const auto executable = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec;
    fs::permissions(temp.path("web/files/bin/run.sh.tpl"), executable);

    Package pkg = package_at(temp);
    pkg.files["bin"] = "/usr/local/bin";

    auto mappings = collect_file_mappings(pkg, temp.path("root"));
    REQUIRE(mappings.isOk());
    auto prepared = prepare_files(mappings.value(), {{"NAME", "demo"}});
    REQUIRE(prepared.isOk());
    REQUIRE(deploy_file(prepared.value()[0]).isOk());

    CHECK(fs::status(temp.path("root/usr/local/bin/run.sh")).permissions() == executable);
}

#endif
