#undef NDEBUG
#include "compiler.h"
#include "listing.h"
#include "options.h"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

static bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

static const char* SAMPLE =
    "// canonical sample\n"
    "main{\n"
    "  counter=0x00;\n"
    "  limit=0xFF;\n"
    "  status=0x05;\n"
    "  if(counter<limit){reg D=0xAA;}\n"
    "  if(status>limit){reg E=0xBB;}\n"
    "  if(A==B){reg H=0xCC;}\n"
    "}\n";

static void test_successful_compile() {
  CompileResult r = compile(SAMPLE);
  assert(r.ok);
  assert(r.lines.size() == 23);
  assert(r.lines.front() == "MVI A,00H;");
  assert(r.lines.back() == "SKIP_2:");
  assert(r.symbols.size() == 3);

  std::string text = joinLines(r.lines);
  assert(text.compare(0, 21, "MVI A,00H;\nSTA 8000H;") == 0);
  assert(text[text.size() - 1] == '\n');

  // same input, same bytes
  assert(joinLines(compile(SAMPLE).lines) == text);
}

static void test_errors_by_stage() {
  CompileResult lex = compile("main{ x = 0x01; # }");
  assert(!lex.ok);
  assert(lex.errorKind == ErrorKind::LEX);
  assert(lex.lines.empty());
  assert(lex.errorLine == 1 && lex.errorCol == 17);

  CompileResult parse = compile("main{\n  reg Z = 0x01;\n}");
  assert(!parse.ok);
  assert(parse.errorKind == ErrorKind::PARSE);
  assert(parse.errorLine == 2);
  assert(parse.lines.empty());

  CompileResult range = compile("main{ reg A = 0x1FF; }");
  assert(!range.ok && range.errorKind == ErrorKind::PARSE);

  // four digits is a word literal even when the value fits a byte
  CompileResult wide = compile("main{ x = 0x00FF; }");
  assert(!wide.ok && wide.errorKind == ErrorKind::PARSE);
  assert(wide.lines.empty());

  CompileResult gen = compile("main{ a=0x1; b=0x2; c=0x3; d=0x4; e=0x5; h=0x6; l=0x7;\n k=0x8; }");
  assert(!gen.ok);
  assert(gen.errorKind == ErrorKind::CODEGEN);
  assert(gen.errorLine == 2);
  assert(gen.lines.empty());
  assert(gen.symbols.size() == 0);
}

static void test_format_error() {
  CompileResult r = compile("main{\n  if(A<B){ reg C=0x01;\n");
  assert(!r.ok);
  std::string msg = formatError(r);
  assert(contains(msg, "ParseError: "));
  assert(contains(msg, "'}' to close \"if\" block expected"));
  assert(contains(msg, "on line 3"));

  CompileResult noPos;
  noPos.errorKind = ErrorKind::CODEGEN;
  noPos.errorMessage = "boom";
  assert(formatError(noPos) == "CodegenError: boom");
}

static void test_listing_success() {
  std::string source = "main{\n  x=0x01;\n  y=0x02;\n}\n";
  CompileResult r = compile(source);
  std::ostringstream out;
  Listing listing(out);
  listing.write("prog.c85", source, r, "TIME");
  std::string text = out.str();

  assert(contains(text, "C85C:\tprog.c85\t\tTIME"));
  assert(contains(text, "SOURCE STATEMENT"));
  assert(contains(text, "    1|main{\n"));
  assert(contains(text, "    3|  y=0x02;\n"));
  assert(contains(text, "x               A         8000H"));
  assert(contains(text, "y               B         8001H"));
  assert(contains(text, "COMPILATION TERMINATED\t\t0 ERRORS ENCOUNTERED"));
  assert(!contains(text, "Error:"));
}

static void test_listing_failure() {
  std::string source = "main{\n  x=0x01;\n  x=0x02;\n  y=0x03;\n}\n";
  CompileResult r = compile(source);
  assert(!r.ok);
  std::ostringstream out;
  Listing listing(out);
  listing.write("dup.c85", source, r, "TIME");
  std::string text = out.str();

  // the error sits right under the offending line, before the next one
  size_t errAt = text.find("Error: Line 3: ParseError: symbol x is multiply defined");
  assert(errAt != std::string::npos);
  assert(errAt > text.find("    3|  x=0x02;"));
  assert(errAt < text.find("    4|  y=0x03;"));
  assert(!contains(text, "SYMBOL"));
  assert(contains(text, "COMPILATION TERMINATED\t\t1 ERROR ENCOUNTERED"));
}

static void test_listing_without_time() {
  std::string source = "main{}\n";
  std::ostringstream out;
  Listing listing(out);
  listing.write("p.c85", source, compile(source), "");
  assert(contains(out.str(), "C85C:\tp.c85\t\t\n"));

  // empty when the local time is unavailable, never a crash
  std::string now = getTime();
  assert(now.size() < 64);
}

static Options parseArgs(std::vector<std::string> args) {
  std::vector<char*> argv;
  for (std::string& a : args) argv.push_back(&a[0]);
  return parseArguments(static_cast<int>(argv.size()), argv.data());
}

static bool usageFails(std::vector<std::string> args) {
  try {
    parseArgs(args);
  } catch (const UsageError&) {
    return true;
  }
  return false;
}

static void test_options() {
  Options o = parseArgs({"c85c", "dir/prog.c85"});
  assert(o.inputPath == "dir/prog.c85");
  assert(o.outputPath == "dir/prog.asm");
  assert(o.listingPath.empty());
  assert(!o.quiet && !o.help);

  o = parseArgs({"c85c", "-q", "prog.c85", "--output", "out.s", "-l", "prog.lst"});
  assert(o.quiet);
  assert(o.outputPath == "out.s");
  assert(o.listingPath == "prog.lst");

  o = parseArgs({"c85c", "--help"});
  assert(o.help);

  assert(defaultOutputPath("noext") == "noext.asm");

  assert(usageFails({"c85c"}));
  assert(usageFails({"c85c", "a.c85", "b.c85"}));
  assert(usageFails({"c85c", "a.c85", "--verbose"}));
  assert(usageFails({"c85c", "a.c85", "-o"}));
}

static void test_output_never_overwrites_input() {
  // an .asm input would default to itself
  assert(usageFails({"c85c", "prog.asm"}));
  assert(usageFails({"c85c", "dir/prog.c85", "-o", "dir/../dir/prog.c85"}));
  assert(usageFails({"c85c", "prog.c85", "-l", "./prog.c85"}));

  Options o = parseArgs({"c85c", "prog.asm", "-o", "prog.out.asm"});
  assert(o.outputPath == "prog.out.asm");

  assert(samePath("a/b.c85", "a/./b.c85"));
  assert(!samePath("a/b.c85", "a/b.asm"));
}

int main() {
  test_successful_compile();
  test_errors_by_stage();
  test_format_error();
  test_listing_success();
  test_listing_failure();
  test_listing_without_time();
  test_options();
  test_output_never_overwrites_input();
  std::cout << "compiler tests passed" << std::endl;
  return 0;
}
