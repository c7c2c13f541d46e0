DECLARE_MESSAGE(ArtifactOverrideNotFound,
                (msg::path, msg::env_var),
                "",
                "the artifact {path} named by {env_var} or --jar does not exist")
DECLARE_MESSAGE(ChecksFailedCheck, (), "", "pdfbox has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksumUnparseable, (msg::url), "", "{url} does not contain a SHA-512 digest")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(CommandIsEmpty, (), "", "cannot run an empty command")
DECLARE_MESSAGE(CropboxNeedsFourValues,
                (msg::count),
                "",
                "a crop box needs exactly four values (x1 y1 x2 y2), but {count} were provided")
DECLARE_MESSAGE(CurlFailedGeneric,
                (msg::exit_code),
                "curl is the name of a program, see curl.se.",
                "curl operation failed with error code {exit_code}.")
DECLARE_MESSAGE(CurlFailedHttpResponse,
                (msg::exit_code, msg::url),
                "curl is the name of a program, see curl.se. {exit_code} is an HTTP status code",
                "{url}: the server answered with HTTP status {exit_code}")
DECLARE_MESSAGE(DownloadFailedHashMismatch,
                (msg::url),
                "",
                "the download does not match the SHA-512 digest published at {url}")
DECLARE_MESSAGE(DownloadFailedHashMismatchActualHash, (msg::sha), "", "Actual  : {sha}")
DECLARE_MESSAGE(DownloadFailedHashMismatchExpectedHash, (msg::sha), "", "Expected: {sha}")
DECLARE_MESSAGE(DownloadFailedUrl, (msg::url), "", "while downloading {url}")
DECLARE_MESSAGE(DownloadingArtifact, (msg::url, msg::path), "", "Downloading {url} -> {path}")
DECLARE_MESSAGE(EnvVarMustBeAbsolutePath,
                (msg::path, msg::env_var),
                "",
                "{env_var} ({path}) must be an absolute path")
DECLARE_MESSAGE(FetchingCatalog, (msg::url), "", "Fetching the list of PDFBox versions from {url}")
DECLARE_MESSAGE(FileNotFound, (), "", "file not found")
DECLARE_MESSAGE(HashFileFailureToRead, (msg::path), "", "failed to read \"{path}\" for hashing")
DECLARE_MESSAGE(HelpAlwaysNext, (), "", "Process the next page (if applicable) despite IOException")
DECLARE_MESSAGE(HelpArchiveUrl, (msg::env_var), "", "Directory listing of PDFBox releases (also {env_var})")
DECLARE_MESSAGE(HelpCacheDir, (msg::env_var), "", "Directory holding downloaded artifacts (also {env_var})")
DECLARE_MESSAGE(HelpColor, (), "", "Color depth: bilevel, gray, rgb or rgba")
DECLARE_MESSAGE(HelpCommandsHeader, (), "Printed before the list of commands", "Commands:")
DECLARE_MESSAGE(HelpCropbox, (), "", "Crop box as x1,y1,x2,y2")
DECLARE_MESSAGE(HelpDebug, (), "", "Print debugging information")
DECLARE_MESSAGE(HelpDebugCommand, (), "", "Open a PDF in the PDFBox debugger")
DECLARE_MESSAGE(HelpDpi, (), "", "Image resolution in dots per inch")
DECLARE_MESSAGE(HelpEncoding, (), "", "Encoding of the text output")
DECLARE_MESSAGE(HelpEndPage, (), "", "Last page to process, starting from 1")
DECLARE_MESSAGE(HelpExampleCommand, (), "", "Example:")
DECLARE_MESSAGE(HelpExtractTextCommand, (), "", "Extract the text of a PDF, to standard output or a file")
DECLARE_MESSAGE(HelpGlobalOptionsHeader, (), "Printed before the list of options every command accepts", "Options:")
DECLARE_MESSAGE(HelpHelpCommand, (), "", "Show help for all commands or one command")
DECLARE_MESSAGE(HelpHtml, (), "", "Write HTML instead of plain text")
DECLARE_MESSAGE(HelpIgnoreBeads, (), "", "Ignore separation by article beads")
DECLARE_MESSAGE(HelpImageType, (), "", "Image format, for example jpg or png")
DECLARE_MESSAGE(HelpJar, (msg::env_var), "", "Use this pdfbox-app jar instead of the cache (also {env_var})")
DECLARE_MESSAGE(HelpJava, (msg::env_var), "", "Java runtime to run the jar with (also {env_var})")
DECLARE_MESSAGE(HelpList, (), "", "List every cached artifact instead")
DECLARE_MESSAGE(HelpListVersionsCommand, (), "", "List the PDFBox versions published in the archive")
DECLARE_MESSAGE(HelpMergeCommand, (), "", "Merge two or more PDFs into one")
DECLARE_MESSAGE(HelpMergeOutput, (), "", "Merged PDF to write (default merged.pdf)")
DECLARE_MESSAGE(HelpOutputPrefix, (), "", "Prefix of the image file names")
DECLARE_MESSAGE(HelpPage, (), "", "Only render this page")
DECLARE_MESSAGE(HelpPassword, (), "", "Password of the PDF")
DECLARE_MESSAGE(HelpPdfBoxVersion, (msg::env_var), "", "Use exactly this PDFBox version (also {env_var})")
DECLARE_MESSAGE(HelpResolveCommand, (), "", "Print the artifact path, downloading the artifact if needed")
DECLARE_MESSAGE(HelpSort, (), "", "Sort the text before writing it")
DECLARE_MESSAGE(HelpSplit, (), "", "Number of pages in each part")
DECLARE_MESSAGE(HelpSplitCommand, (), "", "Split a PDF into several documents")
DECLARE_MESSAGE(HelpStartPage, (), "", "First page to process, starting from 1")
DECLARE_MESSAGE(HelpTime, (), "", "Print the time taken to render each page")
DECLARE_MESSAGE(HelpToImageCommand, (), "", "Render each page of a PDF to an image file")
DECLARE_MESSAGE(HelpVersionCommand, (), "", "Print the version of this tool")
DECLARE_MESSAGE(HelpViewStructure, (), "", "Show the document structure instead of its contents")
DECLARE_MESSAGE(InvalidCommand, (msg::command_name), "", "invalid command: {command_name}")
DECLARE_MESSAGE(MergeNeedsTwoSources,
                (msg::count),
                "",
                "merging needs at least two source files, but {count} were provided")
DECLARE_MESSAGE(NoCachedArtifacts, (msg::path), "", "no artifacts are cached in {path}")
DECLARE_MESSAGE(NonExactlyArgs,
                (msg::command_name, msg::expected, msg::actual),
                "{expected} and {actual} are integers",
                "the command '{command_name}' requires exactly {expected} arguments, but {actual} were provided")
DECLARE_MESSAGE(NonOneRemainingArgs,
                (msg::command_name),
                "",
                "the command '{command_name}' requires exactly one argument")
DECLARE_MESSAGE(NonRangeArgs,
                (msg::command_name, msg::lower, msg::upper, msg::actual),
                "{actual} is an integer",
                "the command '{command_name}' requires between {lower} and {upper} arguments, inclusive, but {actual} "
                "were provided")
DECLARE_MESSAGE(NonRangeArgsGreater,
                (msg::command_name, msg::lower, msg::actual),
                "{actual} is an integer",
                "the command '{command_name}' requires at least {lower} arguments, but {actual} were provided")
DECLARE_MESSAGE(NonZeroOrOneRemainingArgs,
                (msg::command_name),
                "",
                "the command '{command_name}' requires zero or one arguments")
DECLARE_MESSAGE(NonZeroRemainingArgs,
                (msg::command_name),
                "",
                "the command '{command_name}' does not accept any additional arguments")
DECLARE_MESSAGE(NoVersionsInCatalog, (msg::url), "", "{url} does not list any PDFBox versions")
DECLARE_MESSAGE(NoVersionsToResolve, (msg::url), "", "there are no versions to choose from at {url}")
DECLARE_MESSAGE(OptionRequiresANonDashesValue,
                (msg::option, msg::actual, msg::value),
                "",
                "the option {option} requires an argument, but was given {actual}; if you intended to pass "
                "{value}, use {actual}={value} instead")
DECLARE_MESSAGE(OptionRequiresAnInteger,
                (msg::option, msg::value),
                "",
                "--{option} requires an integer, but was given '{value}'")
DECLARE_MESSAGE(OptionRequiresAValue, (msg::option), "", "the option '{option}' requires a value")
DECLARE_MESSAGE(Options, (), "Printed just before a list of options for a command", "Options")
DECLARE_MESSAGE(OptionUsedMultipleTimes, (msg::option), "", "the option '{option}' was specified multiple times")
DECLARE_MESSAGE(PinnedVersionNotInCatalog,
                (msg::version, msg::url),
                "",
                "the requested PDFBox version {version} is not listed at {url}")
DECLARE_MESSAGE(RunningCommand, (msg::command_line), "", "PDFBox is running command: {command_line}")
DECLARE_MESSAGE(RuntimeNotFound,
                (msg::value),
                "{value} is the name of an executable, such as java",
                "{value} was not found on PATH")
DECLARE_MESSAGE(RuntimeOverrideNotFound,
                (msg::path, msg::env_var),
                "",
                "the Java runtime {path} named by {env_var} or --java is not a file")
DECLARE_MESSAGE(SkippingUnparseableArtifact,
                (msg::path),
                "",
                "skipping {path}: the version in its name cannot be parsed")
DECLARE_MESSAGE(SpawnFailed, (msg::command_line), "", "failed to start {command_line}")
DECLARE_MESSAGE(SwitchUsedMultipleTimes, (msg::option), "", "the switch '{option}' was specified multiple times")
DECLARE_MESSAGE(SystemApiErrorMessage,
                (msg::system_api, msg::exit_code, msg::error_msg),
                "",
                "calling {system_api} failed with {exit_code} ({error_msg})")
DECLARE_MESSAGE(UnableToReadEnvironmentVariable, (msg::env_var), "", "unable to read {env_var}")
DECLARE_MESSAGE(UnexpectedArgument,
                (msg::option),
                "Argument is literally what the user passed on the command line.",
                "unexpected argument: {option}")
DECLARE_MESSAGE(UnexpectedOption, (msg::option), "", "unexpected option: {option}")
DECLARE_MESSAGE(UnexpectedSwitch, (msg::option), "", "unexpected switch: {option}")
DECLARE_MESSAGE(UsageHeader, (), "", "usage: pdfbox [options] <command> [<args>]")
DECLARE_MESSAGE(VersionCommandHeader, (msg::version), "", "pdfbox-cxx version {version}")
DECLARE_MESSAGE(VersionInvalid, (msg::version), "", "'{version}' is not a valid version")
