#pragma once

// Print the upload command usage information
void printUploadUsage();

// Main entry point for the upload command
int uploadMain(int argc, char* argv[]);
