#include "SHADER.h"
#include "./src/sim/ERRORS.h"

#include <fstream>
#include <sstream>
#include <iostream>
#include <string>

using namespace std;

static string readFile(const char* path)
{
    ifstream file(path);
    if (!file.is_open()) {
        cerr << "Failed to open shader file: " << path << endl;
        throw ParallelEvaluatorFailure(string("missing shader source: ") + path);
    }
    stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static GLuint compileShader(GLenum type, const string& sourceStr, const char* path)
{
    const char* source = sourceStr.c_str();

    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, NULL);
    glCompileShader(shader);

    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, 512, NULL, infoLog);
        cerr << "ERROR::SHADER::COMPILATION_FAILED: " << path << "\n" << infoLog << endl;
        glDeleteShader(shader);
        throw ParallelEvaluatorFailure(string("shader compilation failed: ") + path);
    }
    return shader;
}

static void linkProgram(GLuint program)
{
    glLinkProgram(program);

    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, 512, NULL, infoLog);
        cerr << "ERROR::PROGRAM::LINKING_FAILED\n" << infoLog << endl;
        glDeleteProgram(program);
        throw ParallelEvaluatorFailure("program linking failed");
    }
}

GLuint createComputeProgram(const char* filepath)
{
    // 1. read and compile the kernel
    string source = readFile(filepath);
    GLuint shader = compileShader(GL_COMPUTE_SHADER, source, filepath);

    // 2. link it into its own program
    GLuint program = glCreateProgram();
    glAttachShader(program, shader);
    glDeleteShader(shader);
    linkProgram(program);

    return program;
}

GLuint createRenderProgram(const char* vertexPath, const char* fragmentPath)
{
    string vertexSource   = readFile(vertexPath);
    string fragmentSource = readFile(fragmentPath);

    GLuint vertexShader = compileShader(GL_VERTEX_SHADER, vertexSource, vertexPath);
    GLuint fragmentShader;
    try {
        fragmentShader = compileShader(GL_FRAGMENT_SHADER, fragmentSource, fragmentPath);
    } catch (const ParallelEvaluatorFailure&) {
        glDeleteShader(vertexShader);
        throw;
    }

    GLuint shaderProgram = glCreateProgram();
    glAttachShader(shaderProgram, vertexShader);
    glAttachShader(shaderProgram, fragmentShader);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);
    linkProgram(shaderProgram);

    return shaderProgram;
}

void checkGLError(const char* where)
{
    GLenum err = glGetError();
    if (err == GL_NO_ERROR) return;

    cerr << "GL error 0x" << hex << err << dec << " after " << where << endl;
    throw ParallelEvaluatorFailure(string("GL error after ") + where);
}
